/**
 * @file slu_train.cpp
 * @brief Joint slot tagging and intent detection: training and testing
 *
 * Usage:
 *   slu_train --task_st slot_tagger_with_crf --task_sc 2tails \
 *             --dataset atis --dataroot data/atis --bidirectional \
 *             --emb_size 100 --hidden_size 200 --optim adam --lr 0.001
 *
 *   slu_train --config run.json --testing \
 *             --read_model experiment/<run>/model --out_path eval/
 *
 * Every option may also come from the JSON file given with --config;
 * command-line values override it.
 */

#include <exception>
#include <iostream>

#include "slu/options.h"
#include "slu/trainer.h"

int main(int argc, char* argv[]) {
    try {
        Options options = Options::parseCommandLine(argc, argv);
        runJointSLU(options);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
