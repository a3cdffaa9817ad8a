// This Source Code Form is subject to the terms of the Mozilla Public
// License, version 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <fmt/core.h>

#include "reader.hh"
#include "../logger.hh"

namespace {

    constexpr int reader_options = XML_PARSE_NONET | XML_PARSE_NOCDATA;

    std::string to_string(const xmlChar *s) {
        if (s)
            return reinterpret_cast<const char*>(s);
        else
            return {};
    }

    int read_input(void *context, char *buffer, int len) {
        auto& input = *static_cast<std::istream*>(context);
        if (input.bad())
            return -1;
        input.read(buffer, len);
        return static_cast<int>(input.gcount());
    }

    void on_error(void *arg, const char *msg, xmlParserSeverities severity,
                  xmlTextReaderLocatorPtr locator) {
        auto& error = *static_cast<std::string*>(arg);
        std::string_view text(msg ? msg : "");
        while (!text.empty() && text.back() == '\n')
            text.remove_suffix(1);
        int line = locator ? xmlTextReaderLocatorLineNumber(locator) : -1;

        if (severity == XML_PARSER_SEVERITY_WARNING
            || severity == XML_PARSER_SEVERITY_VALIDITY_WARNING) {
            iqcodec::log().debug("xml", "line {}: {}", line, text);
            return;
        }
        // first error is the useful one
        if (error.empty())
            error = fmt::format("line {}: {}", line, text);
    }

}

void xml::initialize() {
    static const bool initialized = [] {
        xmlInitParser();
        return true;
    }();
    (void)initialized;
}

xml::reader::reader(std::string_view text)
    : m_text((initialize(), text))
    , m_ptr(xmlReaderForMemory(m_text.data(), static_cast<int>(m_text.size()),
                               nullptr, nullptr, reader_options),
            &xmlFreeTextReader) {
    check_open();
}

xml::reader::reader(std::istream& input)
    : m_ptr((initialize(), xmlReaderForIO(&read_input, nullptr, &input,
                           nullptr, nullptr, reader_options)),
            &xmlFreeTextReader) {
    check_open();
}

xml::reader::~reader() {
}

void xml::reader::check_open() {
    if (!m_ptr)
        throw error("failed to create xml reader");
    xmlTextReaderSetErrorHandler(m_ptr.get(), &on_error, &m_error);
}

xml::qname xml::reader::current_name() {
    return {
        to_string(xmlTextReaderConstNamespaceUri(m_ptr.get())),
        to_string(xmlTextReaderConstLocalName(m_ptr.get())),
    };
}

std::optional<xml::token> xml::reader::next() {
    if (m_pending_end) {
        end_element end = std::move(*m_pending_end);
        m_pending_end.reset();
        return end;
    }

    xmlTextReaderPtr ptr = m_ptr.get();
    for (;;) {
        int ret = xmlTextReaderRead(ptr);
        if (ret < 0 || !m_error.empty())
            throw error(fmt::format("malformed markup: {}",
                                    m_error.empty() ? "read failed" : m_error));
        if (ret == 0)
            return {};

        switch (xmlTextReaderNodeType(ptr)) {
        case XML_READER_TYPE_ELEMENT:
        {
            start_element start { current_name(), {} };
            if (xmlTextReaderMoveToFirstAttribute(ptr) == 1) {
                do {
                    start.attributes.push_back({
                        current_name(),
                        to_string(xmlTextReaderConstName(ptr)),
                        to_string(xmlTextReaderConstValue(ptr)),
                    });
                } while (xmlTextReaderMoveToNextAttribute(ptr) == 1);
                xmlTextReaderMoveToElement(ptr);
            }
            if (xmlTextReaderIsEmptyElement(ptr) == 1)
                m_pending_end = end_element { start.name };
            return start;
        }
        case XML_READER_TYPE_END_ELEMENT:
            return end_element { current_name() };
        case XML_READER_TYPE_TEXT:
        case XML_READER_TYPE_CDATA:
        case XML_READER_TYPE_WHITESPACE:
        case XML_READER_TYPE_SIGNIFICANT_WHITESPACE:
            return char_data { to_string(xmlTextReaderConstValue(ptr)) };
        default:
            // comments, processing instructions, doctype
            continue;
        }
    }
}

xml::token xml::reader::expect() {
    auto tok = next();
    if (!tok)
        throw error("unexpected end of stream");
    return std::move(*tok);
}

std::optional<xml::start_element> xml::reader::next_element() {
    while (auto tok = next()) {
        if (auto *start = std::get_if<start_element>(&*tok))
            return std::move(*start);
        if (auto *end = std::get_if<end_element>(&*tok))
            throw error(fmt::format("unexpected end element {}", end->name.local));
    }
    return {};
}

void xml::reader::skip() {
    int depth = 1;
    while (depth > 0) {
        std::visit(overloaded {
            [&](const start_element&) { ++depth; },
            [&](const end_element&) { --depth; },
            [&](const char_data&) {},
        }, expect());
    }
}

std::string xml::reader::inner_xml() {
    if (m_pending_end)
        return {};
    xmlChar *raw = xmlTextReaderReadInnerXml(m_ptr.get());
    if (!m_error.empty()) {
        if (raw)
            xmlFree(raw);
        throw error(fmt::format("malformed markup: {}", m_error));
    }
    if (!raw)
        return {};
    std::string result = to_string(raw);
    xmlFree(raw);
    return result;
}
