#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "core/Logger.h"
#include "core/Preferences.h"
#include "core/Report.h"
#include "operators/Operator.h"
#include "operators/SpaceSwitchOperators.h"
#include "scene/Scene.h"
#include "scene/SceneSerializer.h"
#include "spaceswitch/TempArmature.h"

using namespace rs;
using json = nlohmann::json;

namespace {

void PrintUsage()
{
    std::cout << "usage: rigspace <scene.json> <operator> [key=value ...] [--prefs file] [--out file]\n"
              << "       rigspace <scene.json> --list\n"
              << "       rigspace <scene.json> --check-tags [--prefs file]\n";
}

void PrintOperators(operators::OperatorContext& ctx)
{
    for (const auto& [id, factory] : operators::OperatorRegistry::Instance().GetRegistry()) {
        std::unique_ptr<operators::Operator> op = factory();
        std::cout << (op->Poll(ctx) ? "  * " : "    ") << id << "  " << op->Description() << "\n";
    }
}

// Values that parse as JSON keep their type, anything else is a string.
json ParsePropertyValue(const std::string& text)
{
    json value = json::parse(text, nullptr, false);
    if (value.is_discarded()) return json(text);
    return value;
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 3) {
        PrintUsage();
        return 2;
    }

    const std::string scenePath = argv[1];
    std::string command;
    std::string prefsPath;
    std::string outPath;
    json props = json::object();

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--prefs" || arg == "--out") {
            if (i + 1 >= argc) {
                Logger::LogError("[CLI] " + arg + " needs a file name");
                return 2;
            }
            (arg == "--prefs" ? prefsPath : outPath) = argv[++i];
        }
        else if (command.empty()) {
            command = arg;
        }
        else {
            auto eq = arg.find('=');
            if (eq == std::string::npos || eq == 0) {
                Logger::LogError("[CLI] Expected key=value, got '" + arg + "'");
                return 2;
            }
            props[arg.substr(0, eq)] = ParsePropertyValue(arg.substr(eq + 1));
        }
    }

    Preferences prefs;
    if (!prefsPath.empty() && !Preferences::Load(prefsPath, prefs))
        return 1;

    scene::Scene scene;
    if (!scene::SceneSerializer::LoadFromFile(scenePath, scene))
        return 1;

    operators::OperatorRegistry& registry = operators::OperatorRegistry::Instance();
    operators::RegisterSpaceSwitchingOperators(registry);

    ReportList reports;
    operators::OperatorContext ctx{ scene, prefs, reports };

    if (command == "--list") {
        PrintOperators(ctx);
        return 0;
    }
    if (command == "--check-tags") {
        auto violations = spaceswitch::FindTagInvariantViolations(scene, prefs);
        for (const auto& v : violations)
            std::cout << v << "\n";
        return violations.empty() ? 0 : 1;
    }

    std::unique_ptr<operators::Operator> op = registry.Create(command);
    if (!op) {
        Logger::LogError("[CLI] Unknown operator '" + command + "'. Use --list to see the available ones.");
        return 2;
    }

    operators::OperatorStatus status = operators::CallOperator(*op, ctx, props);
    if (status != operators::OperatorStatus::Finished)
        return 1;

    const std::string savePath = outPath.empty() ? scenePath : outPath;
    if (!scene::SceneSerializer::SaveToFile(scene, savePath))
        return 1;

    Logger::Log("[CLI] " + std::string(op->Label()) + " finished, saved " + savePath);
    return 0;
}
