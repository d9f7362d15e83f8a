#include "slu/crf.h"
#include "slu/activation.h"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

CRF::CRF(size_t num_tags)
    : num_tags(num_tags), start_tag(num_tags), stop_tag(num_tags + 1),
      transitions("crf.transitions", num_tags + 2, num_tags + 2) {
    if (num_tags == 0) {
        throw std::invalid_argument("CRF needs at least one tag");
    }
    initializeWeights(0.1);
}

void CRF::initializeWeights(double scale) {
    transitions.value.randomize(-scale, scale);
    pinImpossibleTransitions();
}

void CRF::pinImpossibleTransitions() {
    size_t size = num_tags + 2;
    for (size_t i = 0; i < size; ++i) {
        transitions.value[i][start_tag] = kImpossible;
        transitions.value[stop_tag][i] = kImpossible;
    }
}

void CRF::setTransition(size_t from, size_t to, double value) {
    if (to == start_tag || from == stop_tag) {
        throw std::invalid_argument("Transitions into START or out of STOP are fixed");
    }
    transitions.value.set(from, to, value);
}

// ==================== Shape checks ====================

std::vector<size_t> CRF::lengthsFromMask(const SequenceMask& mask) {
    std::vector<size_t> lengths;
    lengths.reserve(mask.size());
    for (size_t b = 0; b < mask.size(); ++b) {
        const std::vector<unsigned char>& row = mask[b];
        size_t length = 0;
        while (length < row.size() && row[length]) ++length;
        for (size_t t = length; t < row.size(); ++t) {
            if (row[t]) {
                throw std::invalid_argument("Mask row " + std::to_string(b) +
                                            " is not a prefix of valid positions");
            }
        }
        if (length == 0) {
            throw std::invalid_argument("CRF cannot score a zero-length sequence (row " +
                                        std::to_string(b) + ")");
        }
        lengths.push_back(length);
    }
    return lengths;
}

void CRF::checkEmissions(const std::vector<Matrix>& emissions, size_t batch_size) const {
    for (const Matrix& step : emissions) {
        if (step.getRows() != batch_size || step.getCols() != num_tags) {
            throw std::invalid_argument("Emissions must be (batch x num_tags) at every timestep");
        }
    }
}

// ==================== Forward algorithm ====================

std::vector<std::vector<double>> CRF::forwardMessages(const std::vector<Matrix>& emissions,
                                                      size_t row, size_t length) const {
    std::vector<std::vector<double>> alpha(length, std::vector<double>(num_tags));
    for (size_t j = 0; j < num_tags; ++j) {
        alpha[0][j] = transitions.value[start_tag][j] + emissions[0][row][j];
    }

    std::vector<double> terms(num_tags);
    for (size_t t = 1; t < length; ++t) {
        for (size_t j = 0; j < num_tags; ++j) {
            for (size_t i = 0; i < num_tags; ++i) {
                terms[i] = alpha[t - 1][i] + transitions.value[i][j];
            }
            alpha[t][j] = logSumExp(terms) + emissions[t][row][j];
        }
    }
    return alpha;
}

std::vector<std::vector<double>> CRF::backwardMessages(const std::vector<Matrix>& emissions,
                                                       size_t row, size_t length) const {
    std::vector<std::vector<double>> beta(length, std::vector<double>(num_tags));
    for (size_t i = 0; i < num_tags; ++i) {
        beta[length - 1][i] = transitions.value[i][stop_tag];
    }

    std::vector<double> terms(num_tags);
    for (size_t step = 1; step < length; ++step) {
        size_t t = length - 1 - step;
        for (size_t i = 0; i < num_tags; ++i) {
            for (size_t j = 0; j < num_tags; ++j) {
                terms[j] = transitions.value[i][j] + emissions[t + 1][row][j] + beta[t + 1][j];
            }
            beta[t][i] = logSumExp(terms);
        }
    }
    return beta;
}

std::vector<double> CRF::logPartition(const std::vector<Matrix>& emissions,
                                      const std::vector<size_t>& lengths) const {
    checkEmissions(emissions, lengths.size());

    std::vector<double> log_z(lengths.size());
    std::vector<double> terms(num_tags);
    for (size_t b = 0; b < lengths.size(); ++b) {
        size_t length = lengths[b];
        if (length == 0) {
            throw std::invalid_argument("CRF cannot score a zero-length sequence");
        }
        if (length > emissions.size()) {
            throw std::invalid_argument("Sequence length exceeds the emission timesteps");
        }

        std::vector<std::vector<double>> alpha = forwardMessages(emissions, b, length);
        for (size_t j = 0; j < num_tags; ++j) {
            terms[j] = alpha[length - 1][j] + transitions.value[j][stop_tag];
        }
        log_z[b] = logSumExp(terms);
    }
    return log_z;
}

std::vector<double> CRF::goldScore(const std::vector<Matrix>& emissions,
                                   const std::vector<size_t>& lengths,
                                   const std::vector<std::vector<int>>& tags) const {
    checkEmissions(emissions, lengths.size());
    if (tags.size() != lengths.size()) {
        throw std::invalid_argument("One tag sequence per batch row is required");
    }

    std::vector<double> scores(lengths.size());
    for (size_t b = 0; b < lengths.size(); ++b) {
        size_t length = lengths[b];
        if (length == 0) {
            throw std::invalid_argument("CRF cannot score a zero-length sequence");
        }
        if (tags[b].size() < length || length > emissions.size()) {
            throw std::invalid_argument("Gold tags shorter than the sequence");
        }

        size_t previous = start_tag;
        double score = 0.0;
        for (size_t t = 0; t < length; ++t) {
            int tag = tags[b][t];
            if (tag < 0 || static_cast<size_t>(tag) >= num_tags) {
                throw std::out_of_range("Gold tag id out of range: " + std::to_string(tag));
            }
            score += transitions.value[previous][tag] + emissions[t][b][tag];
            previous = static_cast<size_t>(tag);
        }
        scores[b] = score + transitions.value[previous][stop_tag];
    }
    return scores;
}

double CRF::negLogLikelihood(const std::vector<Matrix>& emissions,
                             const SequenceMask& mask,
                             const std::vector<std::vector<int>>& tags) const {
    std::vector<size_t> lengths = lengthsFromMask(mask);
    std::vector<double> log_z = logPartition(emissions, lengths);
    std::vector<double> gold = goldScore(emissions, lengths, tags);

    double total = 0.0;
    for (size_t b = 0; b < lengths.size(); ++b) {
        total += log_z[b] - gold[b];
    }
    return total;
}

// ==================== Gradient ====================

std::vector<Matrix> CRF::backward(const std::vector<Matrix>& emissions,
                                  const SequenceMask& mask,
                                  const std::vector<std::vector<int>>& tags,
                                  double scale) {
    std::vector<size_t> lengths = lengthsFromMask(mask);
    checkEmissions(emissions, lengths.size());
    std::vector<double> log_z = logPartition(emissions, lengths);

    size_t batch_size = lengths.size();
    std::vector<Matrix> grad_emissions(emissions.size(), Matrix(batch_size, num_tags));
    Matrix& grad_trans = transitions.grad;

    for (size_t b = 0; b < batch_size; ++b) {
        size_t length = lengths[b];
        std::vector<std::vector<double>> alpha = forwardMessages(emissions, b, length);
        std::vector<std::vector<double>> beta = backwardMessages(emissions, b, length);

        // Expected counts: unary marginals P(y_t = j)
        for (size_t t = 0; t < length; ++t) {
            for (size_t j = 0; j < num_tags; ++j) {
                double marginal = std::exp(alpha[t][j] + beta[t][j] - log_z[b]);
                grad_emissions[t][b][j] += scale * marginal;
                if (t == 0) {
                    grad_trans[start_tag][j] += scale * marginal;
                }
                if (t == length - 1) {
                    grad_trans[j][stop_tag] += scale * marginal;
                }
            }
        }

        // Pairwise marginals P(y_t-1 = i, y_t = j)
        for (size_t t = 1; t < length; ++t) {
            for (size_t i = 0; i < num_tags; ++i) {
                for (size_t j = 0; j < num_tags; ++j) {
                    double pairwise = std::exp(alpha[t - 1][i] + transitions.value[i][j] +
                                               emissions[t][b][j] + beta[t][j] - log_z[b]);
                    grad_trans[i][j] += scale * pairwise;
                }
            }
        }

        // Observed counts of the gold path
        size_t previous = start_tag;
        for (size_t t = 0; t < length; ++t) {
            int tag = tags.at(b).at(t);
            if (tag < 0 || static_cast<size_t>(tag) >= num_tags) {
                throw std::out_of_range("Gold tag id out of range: " + std::to_string(tag));
            }
            grad_emissions[t][b][tag] -= scale;
            grad_trans[previous][tag] -= scale;
            previous = static_cast<size_t>(tag);
        }
        grad_trans[previous][stop_tag] -= scale;
    }

    return grad_emissions;
}

// ==================== Viterbi ====================

std::vector<std::pair<double, std::vector<int>>> CRF::decode(const std::vector<Matrix>& emissions,
                                                             const SequenceMask& mask) const {
    std::vector<size_t> lengths = lengthsFromMask(mask);
    checkEmissions(emissions, lengths.size());

    std::vector<std::pair<double, std::vector<int>>> results;
    results.reserve(lengths.size());

    for (size_t b = 0; b < lengths.size(); ++b) {
        size_t length = lengths[b];
        if (length > emissions.size()) {
            throw std::invalid_argument("Sequence length exceeds the emission timesteps");
        }

        std::vector<double> delta(num_tags);
        for (size_t j = 0; j < num_tags; ++j) {
            delta[j] = transitions.value[start_tag][j] + emissions[0][b][j];
        }

        std::vector<std::vector<size_t>> backpointers(length, std::vector<size_t>(num_tags, 0));
        std::vector<double> next(num_tags);
        for (size_t t = 1; t < length; ++t) {
            for (size_t j = 0; j < num_tags; ++j) {
                double best = -std::numeric_limits<double>::infinity();
                size_t best_prev = 0;
                for (size_t i = 0; i < num_tags; ++i) {
                    double candidate = delta[i] + transitions.value[i][j];
                    if (candidate > best) {
                        best = candidate;
                        best_prev = i;
                    }
                }
                next[j] = best + emissions[t][b][j];
                backpointers[t][j] = best_prev;
            }
            delta.swap(next);
        }

        // Close the path at STOP, then follow the backpointers
        double best_score = -std::numeric_limits<double>::infinity();
        size_t best_last = 0;
        for (size_t j = 0; j < num_tags; ++j) {
            double candidate = delta[j] + transitions.value[j][stop_tag];
            if (candidate > best_score) {
                best_score = candidate;
                best_last = j;
            }
        }

        std::vector<int> path(length);
        size_t current = best_last;
        for (size_t step = 0; step < length; ++step) {
            size_t t = length - 1 - step;
            path[t] = static_cast<int>(current);
            current = backpointers[t][current];
        }
        results.emplace_back(best_score, std::move(path));
    }
    return results;
}
