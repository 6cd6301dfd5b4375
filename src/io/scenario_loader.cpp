// SPDX-License-Identifier: BSD-3-Clause
// Minimal JSON scenario loader: recursive descent parser, zero dependencies.
#include "gridpilot/io/scenario_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <variant>

namespace gridpilot::io {

namespace {

// ── Minimal JSON value types ─────────────────────────────────────────────────
struct JsonValue;
using JsonObject = std::vector<std::pair<std::string, JsonValue>>;
using JsonArray  = std::vector<JsonValue>;

struct JsonValue {
    std::variant<double, std::string, bool, std::nullptr_t, JsonObject, JsonArray> data;

    template <typename T>
    [[nodiscard]] const T& as(const char* what) const {
        if (const auto* v = std::get_if<T>(&data)) return *v;
        throw std::runtime_error(std::string("JSON value is not ") + what);
    }

    [[nodiscard]] double asNumber() const { return as<double>("a number"); }
    [[nodiscard]] bool asBool() const { return as<bool>("a boolean"); }
    [[nodiscard]] const std::string& asString() const { return as<std::string>("a string"); }
    [[nodiscard]] const JsonObject& asObject() const { return as<JsonObject>("an object"); }
    [[nodiscard]] const JsonArray& asArray() const { return as<JsonArray>("an array"); }

    [[nodiscard]] int asInt() const {
        double v = asNumber();
        if (v != std::floor(v) || std::abs(v) > 1e9) {
            throw std::runtime_error("JSON number is not an integer: " + std::to_string(v));
        }
        return static_cast<int>(v);
    }

    [[nodiscard]] const JsonValue& operator[](const std::string& key) const {
        const auto& obj = asObject();
        for (const auto& [k, v] : obj) {
            if (k == key) return v;
        }
        throw std::runtime_error("JSON key not found: " + key);
    }

    [[nodiscard]] const JsonValue* find(const std::string& key) const {
        if (!std::holds_alternative<JsonObject>(data)) return nullptr;
        const auto& obj = asObject();
        for (const auto& [k, v] : obj) {
            if (k == key) return &v;
        }
        return nullptr;
    }
};

// ── Recursive descent JSON parser ────────────────────────────────────────────
class JsonParser {
public:
    explicit JsonParser(std::string_view input) : input_(input), pos_(0) {}

    JsonValue parse() {
        skipWhitespace();
        auto val = parseValue();
        skipWhitespace();
        if (pos_ != input_.size()) fail("Trailing characters");
        return val;
    }

private:
    std::string_view input_;
    std::size_t pos_;

    [[noreturn]] void fail(const std::string& msg) const {
        throw std::runtime_error("JSON parse error at offset " + std::to_string(pos_) + ": " + msg);
    }

    char peek() const { return pos_ < input_.size() ? input_[pos_] : '\0'; }
    char advance() {
        if (pos_ >= input_.size()) fail("Unexpected end of input");
        return input_[pos_++];
    }

    void skipWhitespace() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_])))
            ++pos_;
    }

    void expect(char c) {
        skipWhitespace();
        if (advance() != c) fail(std::string("Expected '") + c + "'");
    }

    JsonValue parseValue() {
        skipWhitespace();
        char c = peek();
        if (c == '"') return parseString();
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (c == 't' || c == 'f') return parseBool();
        if (c == 'n') return parseNull();
        return parseNumber();
    }

    JsonValue parseString() {
        expect('"');
        std::string s;
        while (peek() != '"') {
            char c = advance();
            if (c == '\\') {
                char e = advance();
                switch (e) {
                    case 'n': s += '\n'; break;
                    case 't': s += '\t'; break;
                    case 'r': s += '\r'; break;
                    case 'b': s += '\b'; break;
                    case 'f': s += '\f'; break;
                    case '"':
                    case '\\':
                    case '/': s += e; break;
                    default:  fail(std::string("Unsupported escape '\\") + e + "'");
                }
            } else {
                s += c;
            }
        }
        advance();  // closing "
        return JsonValue{s};
    }

    JsonValue parseNumber() {
        skipWhitespace();
        std::size_t start = pos_;
        if (peek() == '-') ++pos_;
        while (pos_ < input_.size() && (std::isdigit(static_cast<unsigned char>(peek()))
               || peek() == '.' || peek() == 'e' || peek() == 'E'
               || peek() == '+' || peek() == '-')) {
            if ((peek() == '+' || peek() == '-') && pos_ > start + 1
                && input_[pos_ - 1] != 'e' && input_[pos_ - 1] != 'E') break;
            ++pos_;
        }
        if (pos_ == start) fail("Unexpected character");
        std::string text(input_.substr(start, pos_ - start));
        std::size_t used = 0;
        double val = 0;
        try {
            val = std::stod(text, &used);
        } catch (const std::exception&) {
            fail("Invalid number '" + text + "'");
        }
        if (used != text.size()) fail("Invalid number '" + text + "'");
        return JsonValue{val};
    }

    JsonValue parseObject() {
        expect('{');
        JsonObject obj;
        skipWhitespace();
        if (peek() == '}') { advance(); return JsonValue{obj}; }
        while (true) {
            skipWhitespace();
            auto key = parseString();
            expect(':');
            auto val = parseValue();
            obj.emplace_back(std::get<std::string>(key.data), std::move(val));
            skipWhitespace();
            if (peek() == '}') { advance(); break; }
            expect(',');
        }
        return JsonValue{obj};
    }

    JsonValue parseArray() {
        expect('[');
        JsonArray arr;
        skipWhitespace();
        if (peek() == ']') { advance(); return JsonValue{arr}; }
        while (true) {
            arr.push_back(parseValue());
            skipWhitespace();
            if (peek() == ']') { advance(); break; }
            expect(',');
        }
        return JsonValue{arr};
    }

    JsonValue parseBool() {
        if (input_.substr(pos_, 4) == "true")  { pos_ += 4; return JsonValue{true}; }
        if (input_.substr(pos_, 5) == "false") { pos_ += 5; return JsonValue{false}; }
        fail("Invalid bool");
    }

    JsonValue parseNull() {
        if (input_.substr(pos_, 4) == "null") { pos_ += 4; return JsonValue{nullptr}; }
        fail("Invalid null");
    }
};

// ── Helper: parse a [x, y] cell ──────────────────────────────────────────────
Vec2i parseCell(const JsonValue& v) {
    const auto& arr = v.asArray();
    if (arr.size() != 2) throw std::runtime_error("Cell must be an [x, y] pair");
    return {arr[0].asInt(), arr[1].asInt()};
}

// ── Helper: parse the optional "cost" object ─────────────────────────────────
planners::CostParams parseCostParams(const JsonValue& v) {
    planners::CostParams p;
    auto weight = [](const JsonValue& w, const char* key) {
        int value = w.asInt();
        if (value < 0) throw std::runtime_error(std::string("cost.") + key + " must be >= 0");
        return static_cast<Cost>(value);
    };
    if (auto* x = v.find("referenceSpeed"))    p.referenceSpeed = static_cast<Scalar>(x->asNumber());
    if (auto* x = v.find("friction"))          p.friction = static_cast<Scalar>(x->asNumber());
    if (auto* x = v.find("gravity"))           p.gravity = static_cast<Scalar>(x->asNumber());
    if (auto* x = v.find("angleWeight"))       p.angleWeight = weight(*x, "angleWeight");
    if (auto* x = v.find("distanceWeight"))    p.distanceWeight = weight(*x, "distanceWeight");
    if (auto* x = v.find("heuristicWeight"))   p.heuristicWeight = weight(*x, "heuristicWeight");
    if (auto* x = v.find("reverseMultiplier")) p.reverseMultiplier = weight(*x, "reverseMultiplier");
    return p;
}

// ── Helper: read entire file to string ───────────────────────────────────────
std::string readFile(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs) throw std::runtime_error("Cannot open file: " + path.string());
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

void writeCell(std::ostream& os, const Vec2i& c) {
    os << "[" << c.x() << "," << c.y() << "]";
}

void writeString(std::ostream& os, const std::string& s) {
    os << '"';
    for (char c : s) {
        switch (c) {
            case '"':  os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\n': os << "\\n"; break;
            case '\t': os << "\\t"; break;
            case '\r': os << "\\r"; break;
            default:   os << c; break;
        }
    }
    os << '"';
}

}  // anonymous namespace

collision::OccupancyGrid Scenario::buildGrid() const {
    collision::OccupancyGrid grid(gridWidth, gridHeight);
    for (const auto& cell : blocked) {
        grid.setBlocked(cell.x(), cell.y(), true);
    }
    return grid;
}

Scenario parseScenarioJSON(std::string_view json) {
    JsonParser parser(json);
    auto root = parser.parse();

    Scenario scenario;
    if (auto* name = root.find("name")) scenario.name = name->asString();

    const auto& grid = root["grid"];
    scenario.gridWidth  = grid["width"].asInt();
    scenario.gridHeight = grid["height"].asInt();
    if (auto* blocked = grid.find("blocked")) {
        for (const auto& cell : blocked->asArray()) {
            scenario.blocked.push_back(parseCell(cell));
        }
    }

    if (auto* agent = root.find("agent")) {
        scenario.agent.halfWidth  = static_cast<Scalar>((*agent)["halfWidth"].asNumber());
        scenario.agent.halfHeight = static_cast<Scalar>((*agent)["halfHeight"].asNumber());
    }

    if (auto* heading = root.find("heading")) {
        if (auto* n = heading->find("maxIncrements")) scenario.heading.maxIncrements = n->asInt();
        if (auto* a = heading->find("arc")) scenario.heading.arc = a->asInt();
    }

    if (auto* cost = root.find("cost")) {
        scenario.cost = parseCostParams(*cost);
    }

    const auto& start = root["start"];
    scenario.query.start = Vec2i(start["x"].asInt(), start["y"].asInt());
    if (auto* h = start.find("heading")) scenario.query.startHeading = h->asInt();

    const auto& goal = root["goal"];
    scenario.query.goal = Vec2i(goal["x"].asInt(), goal["y"].asInt());

    return scenario;
}

Scenario loadScenarioJSON(const std::filesystem::path& path) {
    Scenario scenario;
    try {
        scenario = parseScenarioJSON(readFile(path));
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path.string() + ": " + e.what());
    }
    if (scenario.name.empty()) scenario.name = path.stem().string();
    return scenario;
}

std::vector<Scenario> loadScenariosFromDir(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.path().extension() == ".json") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    std::vector<Scenario> scenarios;
    scenarios.reserve(files.size());
    for (const auto& f : files) {
        scenarios.push_back(loadScenarioJSON(f));
    }
    return scenarios;
}

void saveScenarioJSON(const std::filesystem::path& path, const Scenario& scenario) {
    std::ofstream ofs(path);
    if (!ofs) throw std::runtime_error("Cannot write file: " + path.string());

    ofs << std::setprecision(std::numeric_limits<Scalar>::max_digits10);
    ofs << "{\"name\":";
    writeString(ofs, scenario.name);
    ofs << ",\"grid\":{\"width\":" << scenario.gridWidth
        << ",\"height\":" << scenario.gridHeight << ",\"blocked\":[";
    for (std::size_t i = 0; i < scenario.blocked.size(); ++i) {
        if (i > 0) ofs << ",";
        writeCell(ofs, scenario.blocked[i]);
    }
    ofs << "]}";

    ofs << ",\"agent\":{\"halfWidth\":" << scenario.agent.halfWidth
        << ",\"halfHeight\":" << scenario.agent.halfHeight << "}";

    ofs << ",\"heading\":{\"maxIncrements\":" << scenario.heading.maxIncrements
        << ",\"arc\":" << scenario.heading.arc << "}";

    const auto& c = scenario.cost;
    ofs << ",\"cost\":{\"referenceSpeed\":" << c.referenceSpeed
        << ",\"friction\":" << c.friction
        << ",\"gravity\":" << c.gravity
        << ",\"angleWeight\":" << c.angleWeight
        << ",\"distanceWeight\":" << c.distanceWeight
        << ",\"heuristicWeight\":" << c.heuristicWeight
        << ",\"reverseMultiplier\":" << c.reverseMultiplier << "}";

    ofs << ",\"start\":{\"x\":" << scenario.query.start.x()
        << ",\"y\":" << scenario.query.start.y()
        << ",\"heading\":" << scenario.query.startHeading << "}";
    ofs << ",\"goal\":{\"x\":" << scenario.query.goal.x()
        << ",\"y\":" << scenario.query.goal.y() << "}}";

    if (!ofs) throw std::runtime_error("Failed writing file: " + path.string());
}

}  // namespace gridpilot::io
