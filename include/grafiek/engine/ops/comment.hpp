#pragma once

/// @file comment.hpp
/// @brief core/comment: a visual note without slots

#include <grafiek/engine/operation.hpp>

namespace grafiek_engine::ops {

/// Display is left to the editor; the node carries only its label
class Comment : public Operation {
public:
    static constexpr const char* LIBRARY = "core";
    static constexpr const char* OPERATOR = "comment";
    static constexpr const char* LABEL = "Comment";

    [[nodiscard]] static Result<OperationPtr> build();

    [[nodiscard]] OpPath op_path() const override { return op_path_of<Comment>(); }
};

} // namespace grafiek_engine::ops
