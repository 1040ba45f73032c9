#pragma once

/**
 * @file scenex.h
 * @brief Main include for the scenex core library
 */

#include <scenex/errors.h>
#include <scenex/transform.h>
#include <scenex/color.h>
#include <scenex/array.h>
#include <scenex/types.h>
#include <scenex/layout.h>
#include <scenex/field.h>
#include <scenex/evented_model.h>
#include <scenex/node.h>
#include <scenex/scene.h>
#include <scenex/camera.h>
#include <scenex/image.h>
#include <scenex/points.h>
#include <scenex/view.h>
#include <scenex/canvas.h>
#include <scenex/adaptor.h>
#include <scenex/backend.h>
#include <scenex/dispatch.h>
#include <scenex/adaptor_registry.h>
#include <scenex/serialization.h>
#include <scenex/tree_repr.h>

#define SCENEX_VERSION "0.1.0"
