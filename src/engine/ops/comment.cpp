/// @file comment.cpp
/// @brief core/comment operation

#include <grafiek/engine/ops/comment.hpp>

namespace grafiek_engine::ops {

Result<OperationPtr> Comment::build() {
    return OperationPtr(std::make_unique<Comment>());
}

} // namespace grafiek_engine::ops
