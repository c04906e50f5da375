// main.cpp
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>
#include "durableflow/core/engine.h"
#include "modules/parser/workflow_parser.h"

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <workflow.json|workflow.yaml> [--inputs '<json>'] [--config engine.yaml]\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string workflow_path = argv[1];
    std::string config_path = "engine.yaml";
    nlohmann::json inputs = nlohmann::json::object();

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--inputs" && i + 1 < argc) {
            inputs = nlohmann::json::parse(argv[++i], nullptr, false);
            if (inputs.is_discarded() || !inputs.is_object()) {
                std::cerr << "--inputs must be a JSON object\n";
                return 1;
            }
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        // 1. 注册自定义节点类型
        auto nodes = std::make_shared<durableflow::NodeRegistry>();
        nodes->register_handler("uppercase", [](const durableflow::Value& config, const durableflow::Context& context) {
            const std::string key = config.value("from", std::string("text"));
            std::string text = context.contains(key) && context.at(key).is_string() ? context.at(key).get<std::string>() : "";
            std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::toupper(c); });
            return durableflow::Value{{config.value("to", key + "_upper"), text}};
        });

        durableflow::EnginePorts ports;
        ports.node_executor = nodes;

        // 2. 创建引擎；文件型历史会先恢复上次未完成的执行
        auto engine = durableflow::DurableFlowEngine::from_config_file(config_path, ports);
        for (const auto& resumed : engine->resume_pending()) {
            std::cout << "Resumed open execution " << resumed << "\n";
        }

        // 3. 解析并启动
        durableflow::WorkflowParser parser;
        const durableflow::WorkflowDefinition definition = parser.parse_from_file(workflow_path);
        const std::string execution_id = "run-" + std::to_string(
            std::chrono::system_clock::now().time_since_epoch().count());
        engine->start_workflow(execution_id, definition, inputs);

        // 4. 输出结果
        const auto outcome = engine->wait_result(execution_id);
        if (!outcome) {
            std::cerr << "[ERROR] execution " << execution_id << " did not finish\n";
            return 1;
        }
        if (outcome->value("status", std::string()) != "completed") {
            std::cerr << "[FAILED] " << outcome->value("error", std::string("unknown error")) << "\n";
            return 1;
        }

        const nlohmann::json& result = outcome->at("result");
        std::cout << (result.value("success", false) ? "[SUCCESS]\n" : "[ERROR]\n");
        std::cout << result.dump(2) << std::endl;
        return result.value("success", false) ? 0 : 2;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }
}
