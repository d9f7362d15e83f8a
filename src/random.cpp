#include "slu/random.h"

std::mt19937& Random::generator() {
    static std::mt19937 gen(999);
    return gen;
}

void Random::seed(unsigned int value) {
    generator().seed(value);
}

double Random::uniform(double min, double max) {
    std::uniform_real_distribution<> dis(min, max);
    return dis(generator());
}
