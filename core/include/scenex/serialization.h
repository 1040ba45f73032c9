#pragma once

/**
 * @file serialization.h
 * @brief JSON documents for model objects
 *
 * Nodes always carry a "node_type" discriminator ("scene", "camera",
 * "image", "points"), even when default-valued fields are omitted. Parent
 * links are never written; loading rebuilds them from "children".
 *
 * A view document holds "scene" and "camera". The camera is written once,
 * under "camera", and left out of the scene's children; loading attaches it
 * to the scene again. A canvas document holds its "views".
 */

#include <scenex/canvas.h>
#include <scenex/node.h>
#include <scenex/view.h>
#include <nlohmann/json.hpp>
#include <string>

namespace scenex {

/**
 * @brief Serialize any model object
 * @param excludeDefaults Omit fields equal to a freshly made object's
 */
nlohmann::json toJson(const EventedModel& model, bool excludeDefaults = false);

/// toJson() rendered as text
std::string dumpJson(const EventedModel& model, int indent = 2, bool excludeDefaults = false);

/// @name Loading
/// Every loader throws SerializationError for malformed documents and
/// ValidationError for values outside a field's range.
/// @{

NodePtr nodeFromJson(const nlohmann::json& doc);
ViewPtr viewFromJson(const nlohmann::json& doc);
CanvasPtr canvasFromJson(const nlohmann::json& doc);

/**
 * @brief Load a node, view or canvas
 *
 * Documents with "node_type" are nodes, documents with "views" are
 * canvases, documents with "scene" or "camera" are views.
 */
ModelPtr modelFromJson(const nlohmann::json& doc);

/// Parse `text` and load it with modelFromJson()
ModelPtr loadJson(const std::string& text);

/// @}

} // namespace scenex
