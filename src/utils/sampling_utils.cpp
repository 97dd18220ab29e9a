module;
#include <QList>
#include <QRandomGenerator>
#include <QSet>

#include <algorithm>
#include <cmath>
#include <numeric>

module kavosh.utils.sampling_utils;

namespace kavosh::utils {

int argmax(const QList<float>& logits)
{
    if (logits.isEmpty()) return -1;
    return static_cast<int>(std::distance(logits.cbegin(), std::max_element(logits.cbegin(), logits.cend())));
}

void applyRepetitionPenalty(QList<float>& logits, const QList<int>& previous, double penalty)
{
    if (penalty <= 1.0) return;
    QSet<int> seen;
    for (int id : previous) {
        if (id < 0 || id >= logits.size() || seen.contains(id)) continue;
        seen.insert(id);
        float& v = logits[id];
        v = v > 0.0f ? static_cast<float>(v / penalty) : static_cast<float>(v * penalty);
    }
}

QList<double> softmax(const QList<float>& logits, double temperature)
{
    QList<double> probs(logits.size());
    if (logits.isEmpty()) return probs;
    const double t = temperature > 0.0 ? temperature : 1.0;
    const double maxLogit = *std::max_element(logits.cbegin(), logits.cend());
    double sum = 0.0;
    for (qsizetype i = 0; i < logits.size(); ++i) {
        probs[i] = std::exp((logits.at(i) - maxLogit) / t);
        sum += probs[i];
    }
    for (double& p : probs) p /= sum;
    return probs;
}

int sampleToken(const QList<float>& logits,
                double temperature,
                int topK,
                double topP,
                QRandomGenerator& rng)
{
    if (logits.isEmpty()) return -1;
    if (temperature <= 0.0) return argmax(logits);

    const QList<double> probs = softmax(logits, temperature);

    QList<int> order(probs.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&probs](int a, int b) { return probs.at(a) > probs.at(b); });

    qsizetype keep = order.size();
    if (topK > 0) keep = qMin<qsizetype>(keep, topK);
    if (topP > 0.0 && topP < 1.0) {
        double mass = 0.0;
        for (qsizetype i = 0; i < keep; ++i) {
            mass += probs.at(order.at(i));
            if (mass >= topP) {
                keep = i + 1;
                break;
            }
        }
    }

    double total = 0.0;
    for (qsizetype i = 0; i < keep; ++i) total += probs.at(order.at(i));

    double draw = rng.generateDouble() * total;
    for (qsizetype i = 0; i < keep; ++i) {
        draw -= probs.at(order.at(i));
        if (draw <= 0.0) return order.at(i);
    }
    return order.at(keep - 1);
}

} // namespace kavosh::utils
