#include <scenex/headless/backend.h>
#include <scenex/headless/adaptors.h>

namespace scenex::headless {

std::shared_ptr<const Backend> createBackend() {
    auto backend = std::make_shared<Backend>("headless");
    backend->registerAdaptor<Scene, HeadlessScene>();
    backend->registerAdaptor<Camera, HeadlessCamera>();
    backend->registerAdaptor<Image, HeadlessImage>();
    backend->registerAdaptor<Points, HeadlessPoints>();
    backend->registerAdaptor<View, HeadlessView>();
    backend->registerAdaptor<Canvas, HeadlessCanvas>();
    return backend;
}

} // namespace scenex::headless
