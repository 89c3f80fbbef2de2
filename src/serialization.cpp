#include "termcalc/serialization.hpp"

#include "termcalc/calculator.hpp"
#include "termcalc/log.hpp"

#include <json/json.h>

#include <fstream>
#include <memory>
#include <sstream>
#include <utility>
#include <vector>

namespace termcalc {

static SerializationError missing(const std::string& name) {
    return SerializationError("Error: Missing value: \"" + name + "\".");
}

static SerializationError wrong_type(const std::string& name, const std::string& expected) {
    return SerializationError("Error: Wrong value type found for \"" + name + "\". Expected: \"" + expected + "\"");
}

static SerializationError wrong_value(const std::string& value) {
    return SerializationError("Error: Wrong value found: \"" + value + "\".");
}

std::string to_json(const MathContext& context) {
    Json::Value root(Json::objectValue);

    Json::Value constants(Json::objectValue);
    for (const auto& [name, value] : context.user_constants()) {
        Json::Value c;
        c["type"] = value.is_real() ? "Real" : "Complex";
        c["re"] = value.re();
        c["im"] = value.im();
        constants[name] = c;
    }
    root["constants"] = constants;

    Json::Value functions(Json::objectValue);
    for (const auto& [name, f] : context.user_functions()) {
        Json::Value fn;
        fn["definition"] = f.definition;
        Json::Value args(Json::arrayValue);
        for (const auto& a : f.args) args.append(a);
        fn["args"] = args;
        functions[name] = fn;
    }
    root["functions"] = functions;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "    ";
    builder["useSpecialFloats"] = true;
    return Json::writeString(builder, root);
}

static MathResult constant_from_json(const std::string& name, const Json::Value& v) {
    if (!v.isObject()) throw wrong_type(name, "object");
    for (const char* key : {"type", "re", "im"})
        if (!v.isMember(key)) throw missing(name + "." + key);

    if (!v["type"].isString()) throw wrong_type(name + ".type", "string");
    if (!v["re"].isNumeric()) throw wrong_type(name + ".re", "number");
    if (!v["im"].isNumeric()) throw wrong_type(name + ".im", "number");

    const std::string type = v["type"].asString();
    const double re = v["re"].asDouble();
    const double im = v["im"].asDouble();
    if (type == "Real") return MathResult::real(re);
    if (type == "Complex") return MathResult::complex(re, im);
    throw wrong_value(type);
}

struct PendingFunction {
    std::string name;
    std::string definition;
    std::vector<std::string> args;
};

static PendingFunction function_from_json(const std::string& name, const Json::Value& v) {
    if (!v.isObject()) throw wrong_type(name, "object");
    if (!v.isMember("definition")) throw missing(name + ".definition");
    if (!v.isMember("args")) throw missing(name + ".args");
    if (!v["definition"].isString()) throw wrong_type(name + ".definition", "string");
    if (!v["args"].isArray()) throw wrong_type(name + ".args", "array");

    PendingFunction f{name, v["definition"].asString(), {}};
    for (const auto& a : v["args"]) {
        if (!a.isString()) throw wrong_type(name + ".args", "array of strings");
        f.args.push_back(a.asString());
    }
    return f;
}

// Defines f in context; false if the definition does not parse (yet).
static bool try_define(const PendingFunction& f, MathContext& context, std::string& error) {
    std::optional<MathResult> r;
    try {
        r = evaluate_input(f.definition, context);
    } catch (const ParseError& e) {
        error = e.what();
        return false;
    }

    const UserFunction* defined = context.user_function(f.name);
    if (r || !defined || defined->args != f.args) throw wrong_value(f.definition);
    return true;
}

MathContext context_from_json(std::string_view json) {
    Json::CharReaderBuilder builder;
    builder["allowSpecialFloats"] = true;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors))
        throw SerializationError("Error: Deserialization failed due to the following error:\n" + errors);
    if (!root.isObject()) throw wrong_type("root", "object");
    if (!root.isMember("constants")) throw missing("constants");
    if (!root.isMember("functions")) throw missing("functions");

    const Json::Value& constants = root["constants"];
    const Json::Value& functions = root["functions"];
    if (!constants.isObject()) throw wrong_type("constants", "object");
    if (!functions.isObject()) throw wrong_type("functions", "object");

    MathContext context;
    for (const auto& name : constants.getMemberNames()) {
        if (!context.is_valid_name(name) || context.is_built_in_constant(name) || context.is_built_in_function(name))
            throw wrong_value(name);
        context.add_user_constant(name, constant_from_json(name, constants[name]));
    }

    std::vector<PendingFunction> pending;
    for (const auto& name : functions.getMemberNames())
        pending.push_back(function_from_json(name, functions[name]));

    // definitions may use functions defined later in the document
    while (!pending.empty()) {
        std::vector<PendingFunction> retry;
        std::string error;
        for (auto& f : pending) {
            if (!try_define(f, context, error)) retry.push_back(std::move(f));
        }
        if (retry.size() == pending.size()) throw SerializationError(error);
        if (!retry.empty()) logger()->debug("retrying {} function definition(s)", retry.size());
        pending = std::move(retry);
    }
    return context;
}

void save_context(const MathContext& context, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) throw SerializationError("Error: Could not open file \"" + path + "\" for writing.");
    file << to_json(context) << '\n';
    if (!file) throw SerializationError("Error: Could not write file \"" + path + "\".");
    logger()->debug("saved context to {}", path);
}

MathContext load_context(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) throw SerializationError("Error: Could not open file \"" + path + "\".");

    std::stringstream buffer;
    buffer << file.rdbuf();
    MathContext context = context_from_json(buffer.str());
    logger()->debug("loaded context from {}", path);
    return context;
}

} // namespace termcalc
