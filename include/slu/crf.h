#ifndef SLU_CRF_H
#define SLU_CRF_H

#include "matrix.h"
#include "parameter.h"
#include <utility>
#include <vector>

/**
 * @file crf.h
 * @brief Linear-chain CRF over padded, variable-length batches
 *
 * For a tag sequence y of length n and emissions e:
 *
 *    score(y) = T[START, y_0] + Σ_t e_t[y_t] + Σ_t T[y_t-1, y_t] + T[y_n-1, STOP]
 *    log Z    = log Σ_y exp(score(y))
 *    NLL      = log Z − score(gold)
 *
 * T is (L+2) × (L+2) with T[i][j] the score of moving from i to j;
 * START = L and STOP = L+1. Moving into START or out of STOP is pinned to
 * kImpossible and never learns.
 *
 * Emissions come as one (batch × L) matrix per timestep. Row b only counts
 * at positions where mask[b][t] = 1; the mask of every row must be a run
 * of ones followed by zeros.
 */

using SequenceMask = std::vector<std::vector<unsigned char>>;

class CRF {
private:
    size_t num_tags;
    size_t start_tag;
    size_t stop_tag;

    Parameter transitions;  // ((L+2) × (L+2))

    void pinImpossibleTransitions();
    void checkEmissions(const std::vector<Matrix>& emissions, size_t batch_size) const;

    // Forward / backward log messages of one example over its valid prefix
    std::vector<std::vector<double>> forwardMessages(const std::vector<Matrix>& emissions,
                                                     size_t row, size_t length) const;
    std::vector<std::vector<double>> backwardMessages(const std::vector<Matrix>& emissions,
                                                      size_t row, size_t length) const;

public:
    static constexpr double kImpossible = -10000.0;

    /**
     * @brief Constructor
     * @param num_tags Number of real tags L (START and STOP are added)
     */
    explicit CRF(size_t num_tags);

    /**
     * @brief Uniform initialization in [-scale, scale]
     */
    void initializeWeights(double scale);

    /**
     * @brief Valid length of every row
     * @throws std::invalid_argument for a zero-length row or a mask that is
     *         not a prefix of ones
     */
    static std::vector<size_t> lengthsFromMask(const SequenceMask& mask);

    /**
     * @brief log Z of every example (forward algorithm)
     */
    std::vector<double> logPartition(const std::vector<Matrix>& emissions,
                                     const std::vector<size_t>& lengths) const;

    /**
     * @brief Score of the gold path of every example
     */
    std::vector<double> goldScore(const std::vector<Matrix>& emissions,
                                  const std::vector<size_t>& lengths,
                                  const std::vector<std::vector<int>>& tags) const;

    /**
     * @brief Σ_b (log Z_b − score_b(gold))
     */
    double negLogLikelihood(const std::vector<Matrix>& emissions,
                            const SequenceMask& mask,
                            const std::vector<std::vector<int>>& tags) const;

    /**
     * @brief Gradient of scale · negLogLikelihood()
     *
     * Accumulates into the transition gradient and returns the gradient
     * w.r.t. the emissions (zero on padded positions).
     */
    std::vector<Matrix> backward(const std::vector<Matrix>& emissions,
                                 const SequenceMask& mask,
                                 const std::vector<std::vector<int>>& tags,
                                 double scale = 1.0);

    /**
     * @brief Viterbi decoding
     * @return Per example (best path score, best path of its valid length)
     */
    std::vector<std::pair<double, std::vector<int>>> decode(const std::vector<Matrix>& emissions,
                                                            const SequenceMask& mask) const;

    double transition(size_t from, size_t to) const { return transitions.value.get(from, to); }

    /**
     * @brief Overwrite one learnable transition score
     * @throws std::invalid_argument for a transition into START or out of STOP
     */
    void setTransition(size_t from, size_t to, double value);

    ParameterList parameters() { return {&transitions}; }

    size_t getNumTags() const { return num_tags; }
    size_t getStartTag() const { return start_tag; }
    size_t getStopTag() const { return stop_tag; }
};

#endif // SLU_CRF_H
