// SceneX CLI Commands Implementation

#include "cli.h"
#include <scenex/scenex.h>
#include <scenex/headless/adaptors.h>
#include <scenex/headless/backend.h>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace scenex::cli {

namespace {

ModelPtr loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw SerializationError("cannot open '" + path + "'");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadJson(buffer.str());
}

std::string modelLabel(const Node& node) {
    std::string label = node.kindName();
    if (node.name()) {
        label += " '" + *node.name() + "'";
    }
    return label;
}

std::string nativeLabel(const headless::NativeObject& native) {
    std::string label = native.type();
    json name = native.prop("name");
    if (name.is_string()) {
        label += " '" + name.get<std::string>() + "'";
    }
    return label;
}

void printViewTree(const View& view, const std::string& indent) {
    std::cout << indent << "View" << std::endl;
    std::istringstream lines(treeRepr(*view.scene(), modelLabel));
    std::string line;
    while (std::getline(lines, line)) {
        std::cout << indent << "    " << line << std::endl;
    }
}

/// Scene native behind a view, nullptr when it was never materialized
const headless::NativeObject* sceneNative(AdaptorRegistry& registry, const View& view) {
    Adaptor* adaptor = registry.findAdaptor(view.scene()->id());
    return adaptor ? &headless::nativeOf(*adaptor) : nullptr;
}

json nativeTreeJson(AdaptorRegistry& registry, const ModelPtr& model) {
    switch (model->kind()) {
        case ModelKind::View: {
            const auto* scene = sceneNative(registry, static_cast<const View&>(*model));
            return json{{"name", "View"},
                        {"children", json::array({scene ? treeDict(*scene, nativeLabel) : json()})}};
        }
        case ModelKind::Canvas: {
            json views = json::array();
            for (const auto& view : static_cast<const Canvas&>(*model).views()) {
                views.push_back(nativeTreeJson(registry, view));
            }
            return json{{"name", "Canvas"}, {"children", views}};
        }
        default:
            return treeDict(headless::nativeOf(registry.getAdaptor(model, false)), nativeLabel);
    }
}

void printNativeTree(AdaptorRegistry& registry, const ModelPtr& model, const std::string& indent) {
    switch (model->kind()) {
        case ModelKind::View: {
            std::cout << indent << "View" << std::endl;
            const auto* scene = sceneNative(registry, static_cast<const View&>(*model));
            if (scene) {
                std::istringstream lines(treeRepr(*scene, nativeLabel));
                std::string line;
                while (std::getline(lines, line)) {
                    std::cout << indent << "    " << line << std::endl;
                }
            }
            break;
        }
        case ModelKind::Canvas:
            std::cout << indent << "Canvas" << std::endl;
            for (const auto& view : static_cast<const Canvas&>(*model).views()) {
                printNativeTree(registry, view, indent + "    ");
            }
            break;
        default:
            std::cout << indent
                      << treeRepr(headless::nativeOf(registry.getAdaptor(model, false)), nativeLabel)
                      << std::endl;
            break;
    }
}

} // namespace

int treeCommand(const std::string& path) {
    ModelPtr model = loadFile(path);
    switch (model->kind()) {
        case ModelKind::View:
            printViewTree(static_cast<const View&>(*model), "");
            break;
        case ModelKind::Canvas: {
            const auto& canvas = static_cast<const Canvas&>(*model);
            std::cout << "Canvas '" << canvas.title() << "' " << canvas.width() << "x" << canvas.height() << std::endl;
            for (const auto& view : canvas.views()) {
                printViewTree(*view, "    ");
            }
            break;
        }
        default:
            std::cout << treeRepr(static_cast<const Node&>(*model), modelLabel) << std::endl;
            break;
    }
    return 0;
}

int syncCommand(const std::string& path, bool asJson, bool debug) {
    ModelPtr model = loadFile(path);

    RegistryOptions options = RegistryOptions::fromEnvironment();
    if (debug) {
        options.debug = true;
    }
    // Problems are summarized below instead
    options.logUnsupported = options.logUnsupported && !asJson;
    options.logFailures = options.logFailures && !asJson;

    AdaptorRegistry registry(headless::createBackend(), options);
    SyncReport total;
    registry.setReportHandler([&total](const SyncReport& report) { total.merge(report); });
    registry.getAdaptor(model);

    size_t applied = total.count(SetterStatus::Applied);
    size_t unsupported = total.count(SetterStatus::Unsupported);
    size_t failed = total.count(SetterStatus::Failed);

    if (asJson) {
        json out;
        out["tree"] = nativeTreeJson(registry, model);
        out["adaptors"] = registry.size();
        out["applied"] = applied;
        out["unsupported"] = unsupported;
        out["failed"] = failed;
        json problems = json::array();
        for (const auto& r : total.results()) {
            if (r.status != SetterStatus::Applied) {
                problems.push_back(json{{"field", fieldName(r.field)},
                                        {"status", setterStatusName(r.status)},
                                        {"reason", r.reason}});
            }
        }
        out["problems"] = problems;
        std::cout << out.dump(2) << std::endl;
    } else {
        printNativeTree(registry, model, "");
        std::cout << "\n" << registry.size() << " adaptor(s): " << applied << " applied, "
                  << unsupported << " unsupported, " << failed << " failed" << std::endl;
    }
    return failed > 0 ? 1 : 0;
}

int dumpCommand(const std::string& path, bool excludeDefaults) {
    ModelPtr model = loadFile(path);
    std::cout << dumpJson(*model, 2, excludeDefaults) << std::endl;
    return 0;
}

int run(int argc, char** argv) {
    CLI::App app{"SceneX - scene graph synchronization tool"};
    app.set_version_flag("-v,--version", std::string(SCENEX_VERSION));
    app.set_help_flag("-h,--help", "Show this help");
    app.require_subcommand(1);

    std::string treePath;
    auto* treeCmd = app.add_subcommand("tree", "Print the model tree of a scene document");
    treeCmd->add_option("file", treePath, "JSON document (node, view or canvas)")->required();

    std::string syncPath;
    bool syncJson = false;
    bool syncDebug = false;
    auto* syncCmd = app.add_subcommand("sync", "Synchronize a document with the headless backend");
    syncCmd->add_option("file", syncPath, "JSON document (node, view or canvas)")->required();
    syncCmd->add_flag("--json", syncJson, "Output the native tree and summary as JSON");
    syncCmd->add_flag("--debug", syncDebug, "Trace every dispatched event");

    std::string dumpPath;
    bool dumpExcludeDefaults = false;
    auto* dumpCmd = app.add_subcommand("dump", "Load a document and write it back out");
    dumpCmd->add_option("file", dumpPath, "JSON document (node, view or canvas)")->required();
    dumpCmd->add_flag("--exclude-defaults", dumpExcludeDefaults, "Omit fields with default values");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    try {
        if (treeCmd->parsed()) {
            return treeCommand(treePath);
        }
        if (syncCmd->parsed()) {
            return syncCommand(syncPath, syncJson, syncDebug);
        }
        if (dumpCmd->parsed()) {
            return dumpCommand(dumpPath, dumpExcludeDefaults);
        }
    } catch (const Error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

} // namespace scenex::cli
