#include "procchain/transform/transformer.hpp"

#include <stdexcept>

namespace procchain::transform {

Pipeline::Pipeline(std::vector<std::unique_ptr<Transformer>> transformers)
    : transformers_(std::move(transformers)), is_fitted_(false) {
}

void Pipeline::addTransformer(std::unique_ptr<Transformer> transformer) {
	if (is_fitted_) {
		throw std::runtime_error("Cannot add transformers after pipeline is fitted");
	}
	if (!transformer) {
		throw std::invalid_argument("Pipeline step must not be null");
	}
	transformers_.push_back(std::move(transformer));
}

std::vector<std::string> Pipeline::stepNames() const {
	std::vector<std::string> names;
	names.reserve(transformers_.size());
	for (const auto &transformer : transformers_) {
		names.push_back(transformer->getName());
	}
	return names;
}

void Pipeline::ensureFitted() const {
	if (!is_fitted_) {
		throw std::runtime_error("Pipeline must be fitted before transform operations");
	}
}

// Each step is fitted on the output of the previous one, so fit() has to run
// the chain on a scratch copy.
void Pipeline::fit(const core::Series &data) {
	core::Series scratch = data;
	fitTransform(scratch);
}

void Pipeline::fitTransform(core::Series &data) {
	for (auto &transformer : transformers_) {
		transformer->fitTransform(data);
	}
	is_fitted_ = true;
}

void Pipeline::transform(core::Series &data) const {
	ensureFitted();
	for (const auto &transformer : transformers_) {
		transformer->transform(data);
	}
}

} // namespace procchain::transform
