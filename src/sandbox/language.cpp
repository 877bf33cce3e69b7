#include "sandbox/language.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace executor::sandbox {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, language_config &config) {
    j.at("image").get_to(config.image);
    j.at("source").get_to(config.source_file);
    if (j.count("compile") && !j.at("compile").is_null())
        config.compile_command = j.at("compile").get<vector<string>>();
    else
        config.compile_command.reset();
    j.at("execute").get_to(config.execute_command);
}

language_registry::language_registry() {
    add("JAVA", {"openjdk:11-jdk-slim", "Main.java", vector<string>{"javac", "Main.java"}, {"java", "-cp", ".", "Main"}});
    add("PYTHON", {"python:3.9-slim", "main.py", nullopt, {"python", "main.py"}});
    add("CPP", {"gcc:latest", "main.cpp", vector<string>{"g++", "main.cpp", "-o", "main"}, {"./main"}});
}

void language_registry::load(const filesystem::path &path) {
    json j = json::parse(read_file_content(path));
    for (auto &[name, value] : j.items()) {
        add(name, value.get<language_config>());
        LOG(INFO) << "Loaded language " << name << " from " << path;
    }
}

void language_registry::add(const string &language, language_config config) {
    languages[language] = move(config);
}

const language_config &language_registry::get(const string &language) const {
    auto it = languages.find(language);
    if (it == languages.end()) throw unsupported_language(language);
    return it->second;
}

bool language_registry::contains(const string &language) const {
    return languages.count(language) > 0;
}

}  // namespace executor::sandbox
