#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "audit/BundleVerifier.hpp"
#include "audit/LedgerErrors.hpp"
#include "runtime/CommandLine.hpp"
#include "runtime/ConfigLoader.hpp"
#include "runtime/Context.hpp"

using namespace tribunal;
using json = nlohmann::json;

namespace {

constexpr int EXIT_ERROR     = 1;
constexpr int EXIT_NOT_FOUND = 2;
constexpr int EXIT_INTEGRITY = 3;

void print_usage() {
    std::cerr <<
        "usage: tribunal [--config <ini>] <command> [options]\n"
        "\n"
        "  evaluate --user U --client C [--type T] <text | ->\n"
        "  get <event_id>\n"
        "  list [--decision D] [--risk R] [--user U] [--limit N] [--offset N]\n"
        "  override <event_id> --operator O --reason R --decision D [--duration M]\n"
        "  effective <event_id>\n"
        "  export <event_id>\n"
        "  verify-bundle <file>\n"
        "  stats\n";
}

std::string read_stream(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

json events_to_json(const std::vector<AuditEvent>& events) {
    json out = json::array();
    for (const auto& e : events) out.push_back(auditEventToJson(e));
    return out;
}

// ---------------------------------------------------------------------------
// Commands. Each returns the JSON document printed on stdout.
// ---------------------------------------------------------------------------
json cmd_evaluate(Context& ctx, const Args& a) {
    EvaluationInput input;
    const std::string& text = a.arg(0, "text");
    input.text         = text == "-" ? read_stream(std::cin) : text;
    input.content_type = "text";

    RequestMetadata meta;
    meta.user       = a.require("user");
    meta.client_id  = a.require("client");
    meta.input_type = a.opt("type", "text");

    return ctx.service->evaluate(input, meta).to_json();
}

json cmd_list(Context& ctx, const Args& a) {
    EventFilter f;
    if (a.has("decision")) {
        f.decision = parseDecision(a.opt("decision"));
        if (!f.decision) throw UsageError("unknown decision '" + a.opt("decision") + "'");
    }
    if (a.has("risk")) {
        f.risk_level = parseRiskLevel(a.opt("risk"));
        if (!f.risk_level) throw UsageError("unknown risk level '" + a.opt("risk") + "'");
    }
    if (a.has("user")) f.user = a.opt("user");

    constexpr long long MAX = std::numeric_limits<long long>::max();
    long long limit  = a.has("limit")  ? parseInteger(a.opt("limit"),  "--limit",  0, MAX) : 100;
    long long offset = a.has("offset") ? parseInteger(a.opt("offset"), "--offset", 0, MAX) : 0;

    return events_to_json(ctx.service->list_events(f, static_cast<std::size_t>(limit),
                                                   static_cast<std::size_t>(offset)));
}

json cmd_override(Context& ctx, const Args& a) {
    OverrideRequest req;
    req.operator_name = a.require("operator");
    req.reason        = a.require("reason");
    req.new_decision  = a.require("decision");
    if (a.has("duration"))
        req.duration_minutes = static_cast<int>(
            parseInteger(a.opt("duration"), "--duration", 0, std::numeric_limits<int>::max()));

    return auditOverrideToJson(ctx.service->create_override(a.arg(0, "event_id"), req));
}

json cmd_effective(Context& ctx, const Args& a) {
    const std::string& id = a.arg(0, "event_id");
    Timestamp now = systemNow();
    EffectiveDecision d = ctx.service->effective_decision(id, now);

    json j = {
        {"event_id",    id},
        {"decision",    decisionToString(d.decision)},
        {"override_id", d.override_id ? json(*d.override_id) : json(nullptr)},
        {"expires_at",  d.expires_at ? json(Canonicalizer::formatTimestamp(*d.expires_at)) : json(nullptr)},
        {"as_of",       Canonicalizer::formatTimestamp(now)}
    };
    return j;
}

json cmd_verify_bundle(const Context& ctx, const Args& a) {
    const std::string& path = a.arg(0, "bundle file");
    std::ifstream in(path);
    if (!in.is_open()) throw std::runtime_error("cannot open " + path);

    json bundle = json::parse(in);
    BundleReport report = BundleVerifier(ctx.signer).verify(bundle);
    return report.to_json();
}

int run(const std::vector<std::string>& raw, std::ostream& out) {
    std::vector<std::string> rest = raw;
    std::string config_path = "config.ini";
    if (rest.size() >= 2 && rest[0] == "--config") {
        config_path = rest[1];
        rest.erase(rest.begin(), rest.begin() + 2);
    }
    if (rest.empty()) {
        print_usage();
        return EXIT_ERROR;
    }

    const std::string command = rest[0];
    Args a = parseArgs(std::vector<std::string>(rest.begin() + 1, rest.end()));

    ConfigLoader loader;
    if (!loader.load(config_path)) {
        std::cerr << "[CONFIG] Continuing with defaults and environment\n";
    }
    Context ctx(loader.build());

    json result;
    if      (command == "evaluate")      result = cmd_evaluate(ctx, a);
    else if (command == "get")           result = auditEventToJson(ctx.service->get_event(a.arg(0, "event_id")));
    else if (command == "list")          result = cmd_list(ctx, a);
    else if (command == "override")      result = cmd_override(ctx, a);
    else if (command == "effective")     result = cmd_effective(ctx, a);
    else if (command == "export")        result = ctx.service->export_bundle(a.arg(0, "event_id")).to_json();
    else if (command == "verify-bundle") result = cmd_verify_bundle(ctx, a);
    else if (command == "stats")         result = ctx.service->stats().to_json();
    else throw UsageError("unknown command '" + command + "'");

    out << result.dump(2) << "\n";

    if (command == "verify-bundle" && !result.value("valid", false)) return EXIT_INTEGRITY;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> raw(argv + 1, argv + argc);

    // stdout carries only the JSON result; component log lines go to stderr.
    std::ostream out(std::cout.rdbuf());
    std::streambuf* saved = std::cout.rdbuf(std::cerr.rdbuf());

    int rc = EXIT_ERROR;
    try {
        rc = run(raw, out);
    } catch (const UsageError& e) {
        std::cerr << "error: " << e.what() << "\n";
        print_usage();
        rc = EXIT_ERROR;
    } catch (const NotFound& e) {
        std::cerr << "error: " << e.what() << "\n";
        rc = EXIT_NOT_FOUND;
    } catch (const IntegrityViolation& e) {
        std::cerr << "error: " << e.what() << "\n";
        rc = EXIT_INTEGRITY;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        rc = EXIT_ERROR;
    }

    out.flush();
    std::cout.rdbuf(saved);
    return rc;
}
