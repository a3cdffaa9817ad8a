// This Source Code Form is subject to the terms of the Mozilla Public
// License, version 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <utility>
#include <fmt/core.h>

#include "writer.hh"
#include "reader.hh"

namespace {

    const xmlChar *as_xml(const std::string& s) {
        return reinterpret_cast<const xmlChar*>(s.c_str());
    }

    int write_output(void *context, const char *buffer, int len) {
        auto& output = *static_cast<std::ostream*>(context);
        output.write(buffer, len);
        return output ? len : -1;
    }

}

xml::writer::writer()
    : m_buffer(xmlBufferCreate(), &xmlBufferFree)
    , m_ptr(nullptr, &xmlFreeTextWriter) {
    initialize();
    if (!m_buffer)
        throw error("failed to allocate xml buffer");
    m_ptr.reset(xmlNewTextWriterMemory(m_buffer.get(), 0));
    if (!m_ptr)
        throw error("failed to create xml writer");
}

xml::writer::writer(std::ostream& output)
    : m_buffer(nullptr, &xmlBufferFree)
    , m_ptr(nullptr, &xmlFreeTextWriter) {
    initialize();
    xmlOutputBufferPtr out = xmlOutputBufferCreateIO(&write_output, nullptr, &output, nullptr);
    if (!out)
        throw error("failed to create xml output");
    // the text writer owns out from here on
    m_ptr.reset(xmlNewTextWriter(out));
    if (!m_ptr) {
        xmlOutputBufferClose(out);
        throw error("failed to create xml writer");
    }
}

xml::writer::~writer() {
}

void xml::writer::check(int ret, const char *what) {
    if (ret < 0)
        throw error(fmt::format("xml writer: {} failed ({})", what, ret));
}

std::string_view xml::writer::scope() const {
    if (m_scope.empty())
        return {};
    return m_scope.back().space;
}

void xml::writer::push_scope(std::string space) {
    m_scope.push_back({ std::move(space), {} });
}

std::optional<std::string> xml::writer::bound(const std::string& prefix) const {
    for (auto it = m_scope.rbegin(); it != m_scope.rend(); ++it) {
        auto found = it->prefixes.find(prefix);
        if (found != it->prefixes.end())
            return found->second;
    }
    return {};
}

std::optional<std::string> xml::writer::prefix_for(const std::string& uri) const {
    for (auto it = m_scope.rbegin(); it != m_scope.rend(); ++it)
        for (auto& [prefix, bound_uri] : it->prefixes)
            if (bound_uri == uri && bound(prefix) == uri)
                return prefix;
    return {};
}

void xml::writer::declare(const std::string& prefix, const std::string& uri) {
    if (m_scope.empty())
        throw error("xml writer: attribute outside an element");
    auto& prefixes = m_scope.back().prefixes;
    if (auto it = prefixes.find(prefix); it != prefixes.end()) {
        if (it->second != uri)
            throw error(fmt::format("xml writer: prefix {} already bound to {}", prefix, it->second));
        return;
    }
    std::string key = "xmlns:" + prefix;
    check(xmlTextWriterWriteAttribute(m_ptr.get(), as_xml(key), as_xml(uri)), "attribute");
    prefixes.emplace(prefix, uri);
}

void xml::writer::start_element(const qname& name) {
    if (name.space == scope()) {
        start_element(name.local);
        return;
    }
    check(xmlTextWriterStartElementNS(m_ptr.get(), nullptr,
                                      as_xml(name.local), as_xml(name.space)),
          "start element");
    push_scope(name.space);
}

void xml::writer::start_element(std::string_view local) {
    std::string name(local);
    check(xmlTextWriterStartElement(m_ptr.get(), as_xml(name)), "start element");
    push_scope(std::string(scope()));
}

void xml::writer::attribute(std::string_view key, std::string_view value) {
    std::string k(key), v(value);
    check(xmlTextWriterWriteAttribute(m_ptr.get(), as_xml(k), as_xml(v)), "attribute");
}

void xml::writer::attribute(const xml::attribute& attr) {
    const std::string& space = attr.name.space;
    const std::string& local = attr.name.local;

    if (local.empty() || space.empty()) {
        attribute(local.empty() ? attr.key : local, attr.value);
        return;
    }
    if (space == xml_uri) {
        attribute("xml:" + local, attr.value);
        return;
    }
    if (attr.is_declaration()) {
        // the element's own namespace is declared by start_element
        if (local != "xmlns")
            declare(local, attr.value);
        return;
    }

    auto prefix = prefix_for(space);
    if (!prefix) {
        // keep the prefix it was read with unless that is taken here
        std::string wanted;
        if (auto colon = attr.key.find(':'); colon != std::string::npos)
            wanted = attr.key.substr(0, colon);
        if (wanted.empty() || wanted == "xml" || wanted == "xmlns" || bound(wanted)) {
            int n = 0;
            do
                wanted = fmt::format("ns{}", n++);
            while (bound(wanted));
        }
        declare(wanted, space);
        prefix = wanted;
    }
    attribute(*prefix + ":" + local, attr.value);
}

void xml::writer::text(std::string_view s) {
    std::string content(s);
    check(xmlTextWriterWriteString(m_ptr.get(), as_xml(content)), "text");
}

void xml::writer::end_element() {
    if (m_scope.empty())
        throw error("xml writer: no open element");
    check(xmlTextWriterEndElement(m_ptr.get()), "end element");
    m_scope.pop_back();
}

void xml::writer::flush() {
    check(xmlTextWriterFlush(m_ptr.get()), "flush");
}

std::string xml::writer::str() {
    if (!m_buffer)
        throw error("xml writer: not writing to memory");
    flush();
    return std::string(reinterpret_cast<const char*>(xmlBufferContent(m_buffer.get())),
                       xmlBufferLength(m_buffer.get()));
}
