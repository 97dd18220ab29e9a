/*!
 * @file        offline_assistant.cppm
 * @brief       Offline package installation and text generation.
 * @details     Ties the download manager, the tokenizer, and the session
 *              manager together:
 *
 *              - installPackage(): downloads every resource of a package
 *                manifest, loads the vocabulary, then loads the model graph.
 *              - generate(): encodes a prompt and runs forward passes, one
 *                token at a time, until an end token, a stop token, the token
 *                budget, or the context limit is reached.
 *              - chat(): renders a conversation with formatChat() and
 *                generates the assistant reply.
 *
 *              Every generated token is also published through the
 *              tokenGenerated signal, so a front end can stream the answer.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kavosh/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QException>
#include <QFuture>
#include <QList>
#include <QRandomGenerator>
#include <QString>

#include <memory>

#ifndef Q_MOC_RUN
export module kavosh.services.offline_assistant;
export import kavosh.core.errors;
export import kavosh.core.downloadmanager;
export import kavosh.core.tokenizer;
export import kavosh.core.sessionmanager;
export import kavosh.services.package_catalog;
export import kavosh.services.offline_settings;
#endif

#ifdef Q_MOC_RUN
#define KAVOSH_MODULE_EXPORT
#else
#define KAVOSH_MODULE_EXPORT export
#endif

/**
 * @brief Integration layer of the offline assistant.
 *
 * The three collaborators are injected and must outlive the assistant. Only
 * one generation runs at a time.
 */
KAVOSH_MODULE_EXPORT class OfflineAssistant : public QObject {

    Q_OBJECT

    //!< @brief Whether a generation is running.
    Q_PROPERTY(bool generating READ isGenerating NOTIFY generatingChanged)

    //!< @brief Whether a package has been installed by this instance.
    Q_PROPERTY(bool packageComplete READ isPackageComplete NOTIFY packageInstalled)

public:
    /**
     * @brief Construct an assistant.
     * @param downloads Download manager used for package resources.
     * @param tokenizer Tokenizer that receives the vocabulary.
     * @param session Session manager that receives the model graph.
     * @param parent Optional parent QObject.
     */
    OfflineAssistant(DownloadManager& downloads,
                     Tokenizer& tokenizer,
                     SessionManager& session,
                     QObject* parent = nullptr);

    /**
     * @brief Download and load a package.
     *
     * @param manifest Package manifest; must contain a model and a tokenizer.
     * @param downloadOptions Options applied to every resource.
     * @param onProgress Aggregate download progress observer.
     * @param loadOptions Model load options.
     * @return Future finishing when the model is loaded; holds DownloadError,
     *         EngineError, or StateError on failure.
     * @throws StateError if the manifest lacks a model or tokenizer resource.
     */
    QFuture<void> installPackage(const PackageManifest& manifest,
                                 const DownloadOptions& downloadOptions = {},
                                 AggregateProgressCallback onProgress = {},
                                 const LoadOptions& loadOptions = {});

    /**
     * @brief Generate a continuation of a prompt.
     * @return Future of the decoded generated text (special tokens skipped).
     * @throws StateError if the tokenizer or the model is not loaded, a
     *         generation is already running, or the prompt fills the context.
     */
    QFuture<QString> generate(const QString& prompt, const GenerationConfig& config = {});

    /**
     * @brief Generate the assistant reply to a conversation.
     *
     * Adds the end-of-turn and user-turn markers to the stop tokens and trims
     * the reply.
     *
     * @throws StateError under the same conditions as generate().
     */
    QFuture<QString> chat(const QList<ChatMessage>& messages, const GenerationConfig& config = {});

    //!< @brief Ask the running generation to finish after the current step.
    void stop() { m_stopRequested = true; }

    bool isGenerating() const { return m_generating; }
    bool isPackageComplete() const { return m_packageComplete; }

    //!< @brief Whether both the vocabulary and the model are loaded.
    bool isReady() const { return m_tokenizer.isLoaded() && m_session.isReady(); }

    //!< @brief Reseed the sampling generator.
    void setSeed(quint32 seed) { m_rng.seed(seed); }

signals:
    /**
     * @brief Emitted for every generated token.
     * @param text Decoded text of the token (word-boundary marker as space).
     * @param tokenId Token id.
     */
    void tokenGenerated(const QString& text, int tokenId);

    //!< @brief Emitted when a generation starts or ends.
    void generatingChanged();

    //!< @brief Emitted after a package has been installed.
    void packageInstalled();

private:
    struct Generation;

    //!< @brief Run one forward pass of a generation.
    void step(const std::shared_ptr<Generation>& generation);

    //!< @brief Consume the logits of one forward pass.
    void onStepFinished(const std::shared_ptr<Generation>& generation, const TensorMap& outputs);

    //!< @brief Resolve the generation with its decoded text.
    void finishGeneration(const std::shared_ptr<Generation>& generation);

    //!< @brief Fail the generation.
    void failGeneration(const std::shared_ptr<Generation>& generation, const QException& error);

    //!< @brief Build the graph inputs for a token context.
    TensorMap buildInputs(const QList<int>& context) const;

    DownloadManager& m_downloads;
    Tokenizer& m_tokenizer;
    SessionManager& m_session;
    QRandomGenerator m_rng;
    bool m_generating = false;
    bool m_stopRequested = false;
    bool m_packageComplete = false;
};

#include "offline_assistant.moc"
