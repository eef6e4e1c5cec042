#include "raise_http_error.hpp"

#include "../../utils/constants.hpp"
#include "../error/http_error.hpp"

namespace http::middleware {
    http::model::Response RaiseHttpError::call(http::model::Request& req, const Next& next) const {
        http::model::Response resp = next(req);

        if (resp.status_ < constants::HTTP_SUCCESS_LOWER_BOUNDARY || resp.status_ >= constants::HTTP_SUCCESS_UPPER_BOUNDARY) {
            if (resp.effective_url_.empty()) {
                resp.effective_url_ = req.url_;
            }
            throw http::http_error::HttpError::from_response(resp);
        }

        return resp;
    }
}  // namespace http::middleware
