#include <diagram_loaders/json_loader.hpp>
#include <nlohmann/json.hpp>
#include <diagram_model/logger.hpp>
#include <fstream>
#include <memory>

namespace diagram_loaders {

namespace {

std::shared_ptr<spdlog::logger> loaders_logger() {
    static std::shared_ptr<spdlog::logger> logger = diagram_model::component_logger("loaders");
    return logger;
}

std::optional<diagram_catalog::AirportRegistry> parse_registry_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    if (!j.contains("airports") || !j["airports"].is_object()) return std::nullopt;

    diagram_catalog::AirportRegistry out;
    out.base_url = j.contains("base_url") && j["base_url"].is_string()
        ? j["base_url"].get<std::string>() : diagram_catalog::default_airport_registry().base_url;
    for (const auto& [code, number] : j["airports"].items()) {
        if (!number.is_string()) return std::nullopt;
        out.airports[code] = number.get<std::string>();
    }
    return out;
}

} // namespace

std::optional<diagram_catalog::AirportRegistry> load_airport_registry_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_registry_json(j);
    } catch (const nlohmann::json::exception& e) {
        loaders_logger()->warn("Invalid airport registry JSON: {}", e.what());
        return std::nullopt;
    }
}

std::optional<diagram_catalog::AirportRegistry> load_airport_registry_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_airport_registry_from_json(f);
}

} // namespace diagram_loaders
