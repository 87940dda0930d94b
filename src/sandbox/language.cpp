#include "evalbox/sandbox/language.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/replace.hpp>
#include "evalbox/common/exceptions.hpp"
#include "evalbox/common/io_utils.hpp"
#include "evalbox/common/json_utils.hpp"

namespace evalbox {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

const string SOURCE_PLACEHOLDER = "{source}";

vector<string> language_spec::build_command(const fs::path &source_path) const {
    vector<string> result;
    for (auto &arg : command)
        result.push_back(boost::algorithm::replace_all_copy(arg, SOURCE_PLACEHOLDER, source_path.string()));
    return result;
}

void from_json(const json &j, language_spec &spec) {
    spec.source_file = get_value<string>(j, "source_file");
    spec.command = get_value<vector<string>>(j, "command");
    spec.error_signatures = get_value_def(j, vector<string>(), "error_signatures");
    spec.limit_address_space = get_value_def(j, true, "limit_address_space");
    spec.env = get_value_def(j, vector<string>(), "env");
}

language_registry::language_registry() {
    language_spec python;
    python.name = "python";
    python.source_file = "main.py";
    python.command = {"python3", SOURCE_PLACEHOLDER};
    python.error_signatures = {"Traceback (most recent call last)"};
    python.env = {"PYTHONIOENCODING=utf-8", "PYTHONDONTWRITEBYTECODE=1"};
    add(python);
    alias("python3", "python");

    language_spec bash;
    bash.name = "bash";
    bash.source_file = "main.sh";
    bash.command = {"bash", SOURCE_PLACEHOLDER};
    add(bash);

    language_spec sh;
    sh.name = "sh";
    sh.source_file = "main.sh";
    sh.command = {"sh", SOURCE_PLACEHOLDER};
    add(sh);
}

void language_registry::add(const language_spec &spec) {
    if (spec.name.empty())
        throw invalid_input_error("language name must not be empty");
    if (spec.command.empty())
        throw invalid_input_error("command of language " + spec.name + " must not be empty");
    try {
        assert_safe_path(spec.source_file);
    } catch (runtime_error &ex) {
        throw invalid_input_error("source file of language " + spec.name + " is not safe: " + spec.source_file);
    }

    string key = boost::algorithm::to_lower_copy(spec.name);
    aliases.erase(key);
    languages[key] = spec;
}

void language_registry::alias(const string &alias_name, const string &name) {
    string key = boost::algorithm::to_lower_copy(name);
    if (!languages.count(key))
        throw invalid_input_error("unable to alias unknown language " + name);
    aliases[boost::algorithm::to_lower_copy(alias_name)] = key;
}

void language_registry::load(const json &config) {
    json langs = access_optional(config, "languages");
    if (langs.is_null()) return;
    if (!langs.is_object())
        throw invalid_input_error("languages must be an object in " + config.dump(2));

    for (auto &[name, value] : langs.items()) {
        language_spec spec = value.get<language_spec>();
        spec.name = name;
        add(spec);
        LOG(INFO) << "Registered language " << name << " (" << spec.source_file << ")";

        for (auto &alias_name : get_value_def(value, vector<string>(), "aliases"))
            alias(alias_name, name);
    }
}

void language_registry::load(const fs::path &path) {
    string content;
    try {
        content = read_file_content(path);
    } catch (system_error &ex) {
        throw invalid_input_error(ex.what());
    }

    json config = json::parse(content, nullptr, false);
    if (config.is_discarded())
        throw invalid_input_error("language config " + path.string() + " is not a valid json document");
    load(config);
}

const language_spec &language_registry::find(const string &name) const {
    string key = boost::algorithm::to_lower_copy(name);
    auto alias_it = aliases.find(key);
    if (alias_it != aliases.end()) key = alias_it->second;

    auto it = languages.find(key);
    if (it == languages.end())
        throw invalid_input_error("unknown language " + name);
    return it->second;
}

bool language_registry::contains(const string &name) const {
    string key = boost::algorithm::to_lower_copy(name);
    return languages.count(key) || aliases.count(key);
}

}  // namespace evalbox
