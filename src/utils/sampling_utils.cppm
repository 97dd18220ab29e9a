/*!
 * @file        sampling_utils.cppm
 * @brief       Next-token selection helpers for autoregressive generation.
 * @details     Greedy selection, repetition penalty, temperature softmax, and
 *              top-k / top-p (nucleus) sampling over one row of logits.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kavosh/blob/main/LICENSE.md
 */

module;
#include <QList>
#include <QRandomGenerator>

#ifndef Q_MOC_RUN
export module kavosh.utils.sampling_utils;
#endif

#ifdef Q_MOC_RUN
#define KAVOSH_MODULE_EXPORT
#else
#define KAVOSH_MODULE_EXPORT export
#endif

KAVOSH_MODULE_EXPORT namespace kavosh::utils {

/**
 * @brief Index of the largest logit.
 * @return The first maximal index, -1 for an empty row.
 */
int argmax(const QList<float>& logits);

/**
 * @brief Penalizes tokens that were already generated.
 *
 * Positive logits are divided by the penalty, negative ones multiplied, so
 * the token always becomes less likely. Each id is penalized once.
 *
 * @param logits Row of logits, modified in place.
 * @param previous Already generated ids; ids out of range are ignored.
 * @param penalty Penalty factor; values <= 1 leave the row unchanged.
 */
void applyRepetitionPenalty(QList<float>& logits, const QList<int>& previous, double penalty);

/**
 * @brief Temperature-scaled softmax.
 * @param logits Row of logits.
 * @param temperature Temperature, must be > 0.
 * @return Probabilities summing to 1.
 */
QList<double> softmax(const QList<float>& logits, double temperature);

/**
 * @brief Picks the next token.
 *
 * temperature <= 0 selects greedily. Otherwise the row is softmaxed at the
 * given temperature, restricted to the topK most likely tokens (0 disables)
 * and then to the smallest prefix whose mass reaches topP (>= 1 disables),
 * and a token is drawn from the renormalized distribution.
 *
 * @return Token index, -1 for an empty row.
 */
int sampleToken(const QList<float>& logits,
                double temperature,
                int topK,
                double topP,
                QRandomGenerator& rng);

} // namespace kavosh::utils
