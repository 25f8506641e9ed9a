#include "ImageFile.h"
#include "DebugConfiguration.h"
#include "JSON.h"
#include <fstream>
#include <memory>
#include <sstream>

BadgeError loadImageJson(const std::string &jsonText, std::vector<uint8_t> &payload)
{
    payload.clear();

    std::unique_ptr<JSONValue> json_value(JSON::Parse(jsonText.c_str()));
    if (json_value == nullptr || !json_value->IsObject()) {
        LOG_ERROR("Image is not a valid JSON object");
        return BadgeError::INVALID_FILE;
    }

    JSONObject json;
    json = json_value->AsObject();

    if (json.find("bytes") == json.end() || !json["bytes"]->IsArray()) {
        LOG_ERROR("Image has no bytes array");
        return BadgeError::INVALID_FILE;
    }

    if (json.find("height") != json.end() && json["height"]->IsNumber() && json["height"]->AsNumber() != BADGE_GLYPH_HEIGHT) {
        LOG_ERROR("Image must be %d pixels high", BADGE_GLYPH_HEIGHT);
        return BadgeError::INVALID_FILE;
    }

    std::vector<uint8_t> bytes;
    for (JSONValue *v : json["bytes"]->AsArray()) {
        if (!v->IsNumber() || v->AsNumber() < 0 || v->AsNumber() > 255 || v->AsNumber() != (int)v->AsNumber()) {
            LOG_ERROR("Image byte %u is not in 0-255", (unsigned)bytes.size());
            return BadgeError::INVALID_FILE;
        }
        bytes.push_back((uint8_t)v->AsNumber());
    }

    if (bytes.empty()) {
        LOG_ERROR("Image has no bytes");
        return BadgeError::INVALID_FILE;
    }

    if (json.find("segments") != json.end() && json["segments"]->IsNumber()) {
        double segments = json["segments"]->AsNumber();
        if (segments * BADGE_SEGMENT_BYTES != bytes.size()) {
            LOG_ERROR("Image says %g segments but carries %u bytes", segments, (unsigned)bytes.size());
            return BadgeError::INVALID_FILE;
        }
    }

    payload = std::move(bytes);
    LOG_DEBUG("Image of %u bytes", (unsigned)payload.size());
    return BadgeError::NONE;
}

BadgeError loadImageFile(const std::string &path, std::vector<uint8_t> &payload)
{
    std::ifstream in(path);
    if (!in) {
        LOG_ERROR("Unable to open image %s", path.c_str());
        return BadgeError::INVALID_FILE;
    }
    std::stringstream text;
    text << in.rdbuf();
    return loadImageJson(text.str(), payload);
}
