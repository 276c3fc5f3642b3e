#include "flowlayout/options.h"
#include "flowlayout/log.h"
#include <memory>

namespace flowlayout {

namespace {

/// Present, non-null member or nullptr
const Json::Value* member(const Json::Value& obj, const char* key) {
    if (!obj.isMember(key)) return nullptr;
    const Json::Value& value = obj[key];
    if (value.isNull()) return nullptr;
    return &value;
}

void readNumber(const Json::Value& obj, const char* key, const std::string& path, float& out) {
    const Json::Value* value = member(obj, key);
    if (!value) return;
    if (!value->isNumeric()) {
        throw ConfigError("config: '" + path + key + "' must be a number");
    }
    float v = value->asFloat();
    if (v < 0) {
        throw ConfigError("config: '" + path + key + "' must not be negative");
    }
    out = v;
}

const Json::Value* readObject(const Json::Value& obj, const char* key) {
    const Json::Value* value = member(obj, key);
    if (!value) return nullptr;
    if (!value->isObject()) {
        throw ConfigError(std::string("config: '") + key + "' must be an object");
    }
    return value;
}

} // anonymous namespace

LayoutConfig layoutConfigFromJson(const Json::Value& root) {
    if (!root.isObject()) {
        throw ConfigError("config: root must be an object");
    }

    LayoutConfig config;

    if (const Json::Value* size = readObject(root, "pageSize")) {
        readNumber(*size, "w", "pageSize.", config.geometry.size.w);
        readNumber(*size, "h", "pageSize.", config.geometry.size.h);
    }
    if (const Json::Value* margins = readObject(root, "margins")) {
        readNumber(*margins, "top", "margins.", config.geometry.margins.top);
        readNumber(*margins, "right", "margins.", config.geometry.margins.right);
        readNumber(*margins, "bottom", "margins.", config.geometry.margins.bottom);
        readNumber(*margins, "left", "margins.", config.geometry.margins.left);
    }
    if (const Json::Value* footnotes = readObject(root, "footnotes")) {
        readNumber(*footnotes, "topPadding", "footnotes.", config.footnoteTopPadding);
        readNumber(*footnotes, "dividerHeight", "footnotes.", config.footnoteDividerHeight);
    }
    if (const Json::Value* passes = member(root, "maxReservePasses")) {
        if (!passes->isInt() || passes->asInt() < 1) {
            throw ConfigError("config: 'maxReservePasses' must be a positive integer");
        }
        config.maxReservePasses = passes->asInt();
    }
    if (const Json::Value* parallel = member(root, "parallelMeasure")) {
        if (!parallel->isBool()) {
            throw ConfigError("config: 'parallelMeasure' must be a boolean");
        }
        config.parallelMeasure = parallel->asBool();
    }

    FL_LOGD("config: page=%.0fx%.0f passes=%d parallel=%d",
            config.geometry.size.w, config.geometry.size.h,
            config.maxReservePasses, config.parallelMeasure ? 1 : 0);
    return config;
}

LayoutConfig parseLayoutConfig(const std::string& json) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors)) {
        throw ConfigError("config: invalid JSON: " + errors);
    }
    return layoutConfigFromJson(root);
}

} // namespace flowlayout
