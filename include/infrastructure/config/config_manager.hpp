// EN: YAML configuration loader for the orchestration core, with validation, hot reload and environment expansion.
// FR: Chargeur de configuration YAML du cœur d'orchestration, avec validation, rechargement à chaud et expansion d'environnement.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "orchestrator/orchestration_config.hpp"

// Forward declaration
namespace YAML { class Node; }

namespace OBF {

// EN: Holds the active OrchestrationConfig. A load only replaces it after the new one validates.
// FR: Détient l'OrchestrationConfig active. Un chargement ne la remplace qu'après validation de la nouvelle.
class ConfigManager {
public:
    using ReloadCallback = std::function<void(const Orchestrator::OrchestrationConfig&)>;

    // EN: Starts with the built-in onboarding catalog.
    // FR: Démarre avec le catalogue d'onboarding intégré.
    ConfigManager();
    ~ConfigManager();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // EN: Load configuration from YAML file, overlaid on the built-in defaults.
    // FR: Charge la configuration depuis un fichier YAML, superposée aux valeurs intégrées.
    bool loadFromFile(const std::string& filename);

    // EN: Load configuration from YAML string.
    // FR: Charge la configuration depuis une chaîne YAML.
    bool loadFromString(const std::string& yaml_content);

    // EN: Restore the built-in onboarding catalog.
    // FR: Restaure le catalogue d'onboarding intégré.
    void loadDefaults();

    // EN: Save current configuration to YAML file.
    // FR: Sauvegarde la configuration actuelle vers un fichier YAML.
    bool saveToFile(const std::string& filename) const;

    // EN: Current configuration rendered as YAML.
    // FR: Configuration actuelle rendue en YAML.
    std::string dump() const;

    // EN: Apply OBF_* environment overrides to the active configuration.
    // FR: Applique les surcharges d'environnement OBF_* à la configuration active.
    bool loadEnvironmentOverrides(const std::string& prefix = "OBF_");

    std::shared_ptr<const Orchestrator::OrchestrationConfig> current() const;

    // EN: Incremented on every successful load.
    // FR: Incrémenté à chaque chargement réussi.
    uint64_t version() const { return version_.load(); }

    // EN: Errors of the last rejected load, empty after a successful one.
    // FR: Erreurs du dernier chargement rejeté, vide après un succès.
    std::vector<std::string> lastErrors() const;

    // EN: Runs every component validator plus cross-section checks.
    // FR: Exécute chaque validateur de composant plus les contrôles inter-sections.
    static bool validate(const Orchestrator::OrchestrationConfig& config, std::vector<std::string>& errors);

    // EN: Replace ${VAR} occurrences with environment values (empty when unset).
    // FR: Remplace les occurrences ${VAR} par les valeurs d'environnement (vide si absente).
    static std::string expandVariables(const std::string& value);

    // EN: Enable file watching for automatic reload.
    // FR: Active la surveillance de fichier pour rechargement automatique.
    void enableWatching(const std::string& filename,
                        std::chrono::milliseconds interval = std::chrono::milliseconds(1000));

    // EN: Disable file watching.
    // FR: Désactive la surveillance de fichier.
    void disableWatching();

    bool isWatching() const { return watching_enabled_.load(); }

    // EN: Called after a reload produced a valid configuration.
    // FR: Appelé après qu'un rechargement a produit une configuration valide.
    void setReloadCallback(ReloadCallback callback);

private:
    bool apply(const YAML::Node& root, const std::string& origin);
    void install(Orchestrator::OrchestrationConfig config);

    void startWatcher();
    void stopWatcher();
    void checkFileChanges();

    static std::string getEnvironmentVariable(const std::string& name);

    mutable std::mutex mutex_;
    std::shared_ptr<const Orchestrator::OrchestrationConfig> config_;
    std::vector<std::string> last_errors_;
    std::atomic<uint64_t> version_{0};

    // EN: File watching members.
    // FR: Membres de surveillance de fichier.
    std::mutex watch_mutex_;
    std::atomic<bool> watching_enabled_{false};
    std::string watched_file_;
    std::chrono::milliseconds watch_interval_{1000};
    std::filesystem::file_time_type last_write_time_;
    std::unique_ptr<std::thread> watcher_thread_;
    std::atomic<bool> should_stop_watching_{false};
    std::mutex callback_mutex_;
    ReloadCallback reload_callback_;
};

} // namespace OBF
