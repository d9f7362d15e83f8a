#ifndef SLU_RANDOM_H
#define SLU_RANDOM_H

#include <random>

/**
 * @brief Process-wide random sequence
 *
 * Weight initialisation, dropout masks and the per-epoch shuffle all draw
 * from this one generator so that a run is reproducible from its seed.
 */
class Random {
public:
    /**
     * @brief Shared generator (default seed until seed() is called)
     */
    static std::mt19937& generator();

    /**
     * @brief Reseed the shared generator
     */
    static void seed(unsigned int value);

    /**
     * @brief Uniform sample in [min, max)
     */
    static double uniform(double min, double max);
};

#endif // SLU_RANDOM_H
