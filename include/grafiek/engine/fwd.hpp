#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for grafiek_engine

#include <grafiek/structures/slot_map.hpp>

#include <cstddef>

namespace grafiek_engine {

class Value;
class ValueMut;
class Inputs;
class Outputs;
struct TextureHandle;
struct TextureId;
struct SlotDef;
class SignatureRegistry;
struct OpPath;
class Operation;
class ExecutionContext;
class TexturePool;
class Node;
struct NodeRecord;
struct EdgeRecord;
class Mutation;
class Event;
class Message;
class History;
class Engine;
struct Document;

/// Stable handle to a node in the engine graph
using NodeIndex = grafiek_structures::SlotKey<Node>;

/// Position of a slot inside one of a node's slot lists
using SlotIndex = std::size_t;

} // namespace grafiek_engine
