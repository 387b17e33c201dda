#include "streampump/pipeline/predictor.hpp"

#include "streampump/core/errc.hpp"

#include <exception>

namespace streampump::pipeline {

result<message> guarded_predict(predictor& model,
                                const message& frame) {
    try {
        return model.predict(frame);
    } catch (const std::exception&) {
        return err<message>(errc::model_failure);
    } catch (...) {
        return err<message>(errc::model_failure);
    }
}

} // namespace streampump::pipeline
