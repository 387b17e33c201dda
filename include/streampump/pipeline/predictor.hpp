#pragma once

/**
 * @file
 * @brief Processing step applied to each frame in queue-mediated mode.
 */

#include "streampump/core/result.hpp"
#include "streampump/pipeline/message.hpp"

namespace streampump::pipeline {

/**
 * @brief Turns one frame into one result.
 *
 * A single instance is built at startup and shared by every pump, so
 * `predict` must be safe to call concurrently from worker threads. It may
 * block. Failures are reported as `errc::model_failure`.
 */
class predictor {
public:
    virtual ~predictor() = default;

    [[nodiscard]] virtual result<message> predict(const message& frame) = 0;
};

/**
 * @brief Call `model.predict` and turn any escaping exception into
 *        `errc::model_failure`.
 */
[[nodiscard]] result<message> guarded_predict(predictor& model,
                                              const message& frame);

} // namespace streampump::pipeline
