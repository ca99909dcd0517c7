#include "aspect/errors.hpp"

namespace aspect {

grpc::Status to_grpc_status(const std::exception_ptr& error) {
    if (!error) return grpc::Status::OK;

    try {
        std::rethrow_exception(error);
    } catch (const AspectError& e) {
        if (e.is_cancelled()) {
            return grpc::Status(grpc::StatusCode::CANCELLED, e.what());
        }
        if (e.is_invalid_argument()) {
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
        }
        if (e.is_out_of_range()) {
            return grpc::Status(grpc::StatusCode::OUT_OF_RANGE, e.what());
        }
        if (e.is_not_found()) {
            return grpc::Status(grpc::StatusCode::NOT_FOUND, e.what());
        }
        if (dynamic_cast<const DuplicateEntityError*>(&e) != nullptr) {
            return grpc::Status(grpc::StatusCode::ALREADY_EXISTS, e.what());
        }
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    } catch (const std::exception& e) {
        return grpc::Status(grpc::StatusCode::UNKNOWN, e.what());
    } catch (...) {
        return grpc::Status(grpc::StatusCode::UNKNOWN, "non-standard exception");
    }
}

} // namespace aspect
