#pragma once

/**
 * @file backend.h
 * @brief Entry point of the headless reference backend
 *
 * @code
 * scenex::AdaptorRegistry registry(scenex::headless::createBackend());
 * registry.getAdaptor(view);
 * scenex::Array frame = registry.render(view);
 * @endcode
 */

#include <scenex/backend.h>
#include <memory>

namespace scenex::headless {

/// Backend named "headless" with an adaptor for every model kind
std::shared_ptr<const Backend> createBackend();

} // namespace scenex::headless
