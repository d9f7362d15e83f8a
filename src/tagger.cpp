#include "slu/tagger.h"
#include <stdexcept>

namespace {

std::vector<double> padExcludedWeights(size_t num_tags, int pad_tag_id) {
    std::vector<double> weights(num_tags, 1.0);
    weights[static_cast<size_t>(pad_tag_id)] = 0.0;
    return weights;
}

int requirePadTag(const Vocabulary& tag_vocab) {
    int pad_id = tag_vocab.getId(Vocabulary::kPad);
    if (pad_id < 0) {
        throw std::invalid_argument("The tag vocabulary must contain the <pad> tag");
    }
    return pad_id;
}

}  // namespace

SlotTagger::SlotTagger(std::unique_ptr<SequenceEncoder> encoder, const Vocabulary& tag_vocab,
                       bool use_crf)
    : encoder(std::move(encoder)),
      hidden_to_tag(this->encoder->getOutputSize(), tag_vocab.size(), "tagger.hidden2tag"),
      num_tags(tag_vocab.size()),
      pad_tag_id(requirePadTag(tag_vocab)),
      use_crf(use_crf),
      token_loss(padExcludedWeights(tag_vocab.size(), pad_tag_id)) {
    if (use_crf) {
        crf = std::make_unique<CRF>(num_tags);
    }
}

void SlotTagger::initializeWeights(double scale) {
    encoder->initializeWeights(scale);
    hidden_to_tag.initializeWeights(scale);
    if (crf) crf->initializeWeights(scale);
}

ParameterList SlotTagger::parameters() {
    ParameterList params = encoder->parameters();
    for (Parameter* p : hidden_to_tag.parameters()) params.push_back(p);
    if (crf) {
        for (Parameter* p : crf->parameters()) params.push_back(p);
    }
    return params;
}

// ==================== Forward ====================

TaggerOutput SlotTagger::forward(const Batch& batch, bool training) {
    TaggerOutput output;
    output.encoded = encoder->forward(batch, training);
    output.emissions.reserve(output.encoded.hidden.size());
    for (const Matrix& hidden : output.encoded.hidden) {
        output.emissions.push_back(hidden_to_tag.forward(hidden));
    }
    return output;
}

std::vector<Matrix> SlotTagger::tokenTargets(const Batch& batch) const {
    size_t seq_length = batch.maxLength();
    std::vector<Matrix> targets;
    targets.reserve(seq_length);
    for (size_t t = 0; t < seq_length; ++t) {
        std::vector<int> ids(batch.size(), -1);
        for (size_t b = 0; b < batch.size(); ++b) {
            if (t < batch.lengths[b]) ids[b] = batch.tags[b][t];
        }
        targets.push_back(oneHotRows(ids, num_tags));
    }
    return targets;
}

// ==================== Loss ====================

double SlotTagger::loss(const TaggerOutput& output, const Batch& batch) const {
    if (use_crf) {
        return crf->negLogLikelihood(output.emissions, batch.mask, batch.tags);
    }

    std::vector<Matrix> targets = tokenTargets(batch);
    double total = 0.0;
    for (size_t t = 0; t < output.emissions.size(); ++t) {
        total += token_loss.calculate(output.emissions[t], targets[t]);
    }
    return total;
}

std::vector<Matrix> SlotTagger::backward(const TaggerOutput& output, const Batch& batch,
                                         double scale) {
    std::vector<Matrix> grad_emissions;
    if (use_crf) {
        grad_emissions = crf->backward(output.emissions, batch.mask, batch.tags, scale);
    } else {
        std::vector<Matrix> targets = tokenTargets(batch);
        for (size_t t = 0; t < output.emissions.size(); ++t) {
            grad_emissions.push_back(token_loss.gradient(output.emissions[t], targets[t]) * scale);
        }
    }

    std::vector<Matrix> grad_hidden;
    grad_hidden.reserve(grad_emissions.size());
    for (size_t t = 0; t < grad_emissions.size(); ++t) {
        grad_hidden.push_back(hidden_to_tag.backward(output.encoded.hidden[t], grad_emissions[t]));
    }
    return grad_hidden;
}

// ==================== Decode ====================

std::vector<std::vector<int>> SlotTagger::decode(const TaggerOutput& output,
                                                 const Batch& batch) const {
    std::vector<std::vector<int>> paths;
    paths.reserve(batch.size());

    if (use_crf) {
        for (auto& scored : crf->decode(output.emissions, batch.mask)) {
            paths.push_back(std::move(scored.second));
        }
        return paths;
    }

    for (size_t b = 0; b < batch.size(); ++b) {
        std::vector<int> path(batch.lengths[b]);
        for (size_t t = 0; t < batch.lengths[b]; ++t) {
            path[t] = static_cast<int>(output.emissions[t].argmaxRow(b));
        }
        paths.push_back(std::move(path));
    }
    return paths;
}
