#pragma once

#include "procchain/core/types.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace procchain::transform {

/**
 * @class Transformer
 * @brief A value transformation applied in place to one series.
 *
 * Transformers may change the length of the series (resampling, alignment).
 */
class Transformer {
public:
	virtual ~Transformer() = default;

	virtual void fit(const core::Series &data) = 0;
	virtual void transform(core::Series &data) const = 0;
	virtual std::string getName() const = 0;

	virtual void fitTransform(core::Series &data) {
		fit(data);
		transform(data);
	}
};

class Pipeline {
public:
	Pipeline() = default;
	explicit Pipeline(std::vector<std::unique_ptr<Transformer>> transformers);

	Pipeline(const Pipeline &) = delete;
	Pipeline &operator=(const Pipeline &) = delete;
	Pipeline(Pipeline &&) noexcept = default;
	Pipeline &operator=(Pipeline &&) noexcept = default;

	void addTransformer(std::unique_ptr<Transformer> transformer);

	[[nodiscard]] bool isFitted() const noexcept {
		return is_fitted_;
	}
	[[nodiscard]] std::size_t size() const noexcept {
		return transformers_.size();
	}
	[[nodiscard]] bool empty() const noexcept {
		return transformers_.empty();
	}

	/// Step names in application order.
	std::vector<std::string> stepNames() const;

	void fit(const core::Series &data);
	void fitTransform(core::Series &data);
	void transform(core::Series &data) const;

private:
	void ensureFitted() const;

	std::vector<std::unique_ptr<Transformer>> transformers_;
	bool is_fitted_ = false;
};

} // namespace procchain::transform
