/*!
 * @file        offline_settings.cppm
 * @brief       Persisted configuration of the offline assistant.
 * @details     Holds the retry, concurrency, backend, and generation settings,
 *              loads and saves them through QSettings (group "offline"), and
 *              projects them onto the per-call option structs of the
 *              download manager, the session manager, and the assistant.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kavosh/blob/main/LICENSE.md
 */

module;
#include <QList>
#include <QSettings>
#include <QString>

#include <optional>

#ifndef Q_MOC_RUN
export module kavosh.services.offline_settings;
export import kavosh.core.downloadmanager;
export import kavosh.core.sessionmanager;
#endif

#ifdef Q_MOC_RUN
#define KAVOSH_MODULE_EXPORT
#else
#define KAVOSH_MODULE_EXPORT export
#endif

//!< @brief Text generation parameters.
KAVOSH_MODULE_EXPORT struct GenerationConfig {
    int maxNewTokens = 512;             //!< Tokens to generate at most.
    int maxContextLength = 4096;        //!< Prompt plus generated tokens at most.
    double temperature = 0.7;           //!< Sampling temperature; <= 0 selects greedy decoding.
    int topK = 50;                      //!< Keep the k most likely tokens, 0 disables.
    double topP = 0.9;                  //!< Nucleus mass, >= 1 disables.
    double repetitionPenalty = 1.1;     //!< Penalty for already generated tokens, 1 disables.
    QList<int> stopTokens;              //!< Ids that end generation besides EOS.
};

//!< @brief Parse "auto", "gpu" or "portable", ignoring case.
KAVOSH_MODULE_EXPORT std::optional<BackendPreference> backendPreferenceFromString(const QString& name);

//!< @brief Return "auto", "gpu" or "portable".
KAVOSH_MODULE_EXPORT QString backendPreferenceName(BackendPreference preference);

/**
 * @brief Offline assistant settings.
 *
 * Invalid stored values fall back to the defaults with a warning.
 */
KAVOSH_MODULE_EXPORT struct OfflineSettings {
    int maxRetries = 3;
    int retryDelayMs = 1000;
    BackoffMode retryBackoff = BackoffMode::Exponential;
    int maxConcurrent = 2;
    int transferTimeoutMs = 60000;
    BackendPreference executionBackend = BackendPreference::Auto;
    QString manifestUrl;
    GenerationConfig generation;
    bool packageComplete = false;

    //!< @brief Load from the application QSettings.
    static OfflineSettings load();

    //!< @brief Load from a given QSettings store.
    static OfflineSettings load(QSettings& settings);

    //!< @brief Save to the application QSettings.
    void save() const;

    //!< @brief Save to a given QSettings store.
    void save(QSettings& settings) const;

    //!< @brief Download options carrying the retry and timeout settings.
    DownloadOptions downloadOptions() const;

    //!< @brief Model load options carrying the backend preference.
    LoadOptions loadOptions() const;

    //!< @brief Generation parameters.
    GenerationConfig generationConfig() const { return generation; }
};
