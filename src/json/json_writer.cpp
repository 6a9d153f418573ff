#include "negotiate/json/json_writer.hpp"

#include <nlohmann/json.hpp>

#include <cstring>
#include <stdexcept>

namespace negotiate {

JsonWriter::JsonWriter(IByteBufferWriter& output, JsonWriterOptions options)
    : options_(options)
    , output_(&output)
{}

void JsonWriter::reset(IByteBufferWriter& output) {
    reset();
    output_ = &output;
}

void JsonWriter::reset() noexcept {
    output_ = nullptr;
    pending_.clear();
    containers_.clear();
    committed_ = 0;
    needs_separator_ = false;
    root_complete_ = false;
}

// ─────────────────────────────────────────────────────────────────────────────
// Structure
// ─────────────────────────────────────────────────────────────────────────────

void JsonWriter::write_start_object() {
    begin_value();
    open(Container::Object);
}

void JsonWriter::write_start_object(std::string_view property_name) {
    begin_property(property_name);
    open(Container::Object);
}

void JsonWriter::write_end_object() {
    close(Container::Object);
}

void JsonWriter::write_start_array() {
    begin_value();
    open(Container::Array);
}

void JsonWriter::write_start_array(std::string_view property_name) {
    begin_property(property_name);
    open(Container::Array);
}

void JsonWriter::write_end_array() {
    close(Container::Array);
}

// ─────────────────────────────────────────────────────────────────────────────
// Values
// ─────────────────────────────────────────────────────────────────────────────

void JsonWriter::write_string(std::string_view property_name, std::string_view value) {
    const std::string token = quote(value);
    begin_property(property_name);
    pending_.append(token);
    end_value();
}

void JsonWriter::write_null(std::string_view property_name) {
    begin_property(property_name);
    pending_.append("null");
    end_value();
}

void JsonWriter::write_string_value(std::string_view value) {
    const std::string token = quote(value);
    begin_value();
    pending_.append(token);
    end_value();
}

void JsonWriter::flush() {
    if (output_ == nullptr) {
        throw std::logic_error("JsonWriter::flush() called on a detached writer");
    }
    if (pending_.empty()) {
        return;
    }

    auto span = output_->get_span(pending_.size());
    std::memcpy(span.data(), pending_.data(), pending_.size());
    output_->advance(pending_.size());

    committed_ += pending_.size();
    pending_.clear();
}

// ─────────────────────────────────────────────────────────────────────────────
// Internals
// ─────────────────────────────────────────────────────────────────────────────

void JsonWriter::begin_value() {
    if (containers_.empty()) {
        if (root_complete_) {
            throw std::logic_error("JsonWriter: a JSON document has only one root value");
        }
        return;
    }
    if (containers_.back() == Container::Object) {
        throw std::logic_error("JsonWriter: values inside an object need a property name");
    }
    if (needs_separator_) {
        pending_.push_back(',');
    }
}

void JsonWriter::begin_property(std::string_view property_name) {
    if (containers_.empty() || containers_.back() != Container::Object) {
        throw std::logic_error(
            "JsonWriter: property '" + std::string(property_name) + "' written outside of an object");
    }
    const std::string name = quote(property_name);
    if (needs_separator_) {
        pending_.push_back(',');
    }
    pending_.append(name);
    pending_.push_back(':');
}

void JsonWriter::open(Container container) {
    if (containers_.size() >= options_.max_depth) {
        throw std::logic_error(
            "JsonWriter: maximum depth of " + std::to_string(options_.max_depth) + " exceeded");
    }
    pending_.push_back(container == Container::Object ? '{' : '[');
    containers_.push_back(container);
    needs_separator_ = false;
}

void JsonWriter::close(Container container) {
    const bool matches = !containers_.empty() && (containers_.back() == container);
    if (!matches) {
        throw std::logic_error(container == Container::Object
            ? "JsonWriter: write_end_object() without a matching open object"
            : "JsonWriter: write_end_array() without a matching open array");
    }
    pending_.push_back(container == Container::Object ? '}' : ']');
    containers_.pop_back();
    end_value();
}

void JsonWriter::end_value() noexcept {
    needs_separator_ = true;
    if (containers_.empty()) {
        root_complete_ = true;
    }
}

// nlohmann's serializer escapes per RFC 8259 and rejects invalid UTF-8
// with json::type_error (316). Callers quote before touching pending_.
std::string JsonWriter::quote(std::string_view text) {
    return nlohmann::json(text).dump();
}

}  // namespace negotiate
