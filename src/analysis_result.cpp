#include "analysis_result.hpp"
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace {

std::string escapeJson(const std::string& text) {
    std::ostringstream out;
    for (unsigned char c : text) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out << buf;
                } else {
                    out << c;
                }
        }
    }
    return out.str();
}

/// Writes "key": value pairs with comma handling
class JsonObjectWriter {
public:
    JsonObjectWriter() { out << "{"; }

    void field(const std::string& key, const std::string& value) {
        next(key);
        out << "\"" << escapeJson(value) << "\"";
    }
    void field(const std::string& key, const char* value) { field(key, std::string(value)); }
    void field(const std::string& key, bool value) {
        next(key);
        out << (value ? "true" : "false");
    }
    void field(const std::string& key, int value) {
        next(key);
        out << value;
    }
    void field(const std::string& key, double value, int decimals) {
        next(key);
        out << std::fixed << std::setprecision(decimals) << roundTo(value, decimals);
    }
    void number(const std::string& key, double value) {
        next(key);
        out << std::defaultfloat << std::setprecision(10) << value;
    }
    void null(const std::string& key) {
        next(key);
        out << "null";
    }

    std::string str() {
        out << "\n}";
        return out.str();
    }

private:
    void next(const std::string& key) {
        out << (first ? "\n  " : ",\n  ") << "\"" << escapeJson(key) << "\": ";
        first = false;
    }

    std::ostringstream out;
    bool first = true;
};

}  // namespace

double roundTo(double value, int decimals) {
    double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

std::string AnalysisResult::toJson() const {
    JsonObjectWriter json;
    json.field("success", success());

    switch (kind) {
        case ResultKind::SUCCESS:
            json.field("speed_kmh", speedKmh, 1);
            json.field("speed_mph", speedMph, 1);
            json.field("detected_frames", detectedFrames);
            json.field("max_track_length", maxTrackLength);
            json.number("fps", fps);
            json.field("total_frames", totalFrames);
            json.field("tracking_duration_ms", trackingDurationMs, 1);
            json.field("mitt_detected", mittDetected);
            json.field("calibration_method", calibrationMethod);
            json.field("scale_factor", scaleFactor, 6);
            json.field("slowmo_factor", slowmoFactor, 1);
            json.field("detection_count", detectionCount);
            if (hasWarning) {
                json.field("warning", warning);
            } else {
                json.null("warning");
            }
            break;

        case ResultKind::TRACKING_FAILURE:
            json.field("message", message);
            json.number("fps", fps);
            json.field("total_frames", totalFrames);
            json.field("mitt_detected", mittDetected);
            json.field("detection_count", detectionCount);
            json.field("max_track_length", maxTrackLength);
            break;

        case ResultKind::SPEED_FAILURE:
            json.field("message", message);
            json.field("detected_frames", detectedFrames);
            json.number("fps", fps);
            json.field("total_frames", totalFrames);
            json.field("mitt_detected", mittDetected);
            break;

        case ResultKind::INPUT_FAILURE:
        case ResultKind::PROCESSING_FAILURE:
            json.field("message", message);
            break;
    }

    return json.str();
}
