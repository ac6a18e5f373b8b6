#pragma once

#include <pugixml.hpp>
#include <cstddef>
#include <string>

/**
 * @brief Abstract base class for building libvirt XML fragments
 *
 * Derived classes describe the element tree in buildDocument(); the base
 * class owns the pugixml document and serializes it.
 */
class IXmlBuilderBase {
protected:
    pugi::xml_document doc;     ///< Underlying XML document

    /**
     * @brief Constructs the XML document structure
     *
     * Called on a freshly reset document for every build.
     */
    virtual void buildDocument() = 0;

public:
    enum class Layout { Indented, SingleLine };

    IXmlBuilderBase() = default;

    IXmlBuilderBase(const IXmlBuilderBase&) = delete;
    IXmlBuilderBase& operator=(const IXmlBuilderBase&) = delete;

    /**
     * @brief Builds and returns the XML fragment, without declaration
     *
     * @param layout SingleLine is what gets printed in plan summaries;
     *               libvirt accepts both.
     */
    [[nodiscard]] std::string build(Layout layout = Layout::SingleLine) {
        doc.reset();
        buildDocument();

        struct xml_string_writer : pugi::xml_writer {
            std::string result;
            void write(const void* data, size_t size) override {
                result.append(static_cast<const char*>(data), size);
            }
        };

        unsigned int flags = pugi::format_no_declaration;
        flags |= layout == Layout::Indented ? pugi::format_indent : pugi::format_raw;

        xml_string_writer writer;
        doc.save(writer, "  ", flags);
        return writer.result;
    }

    /**
     * @brief Provides access to the document produced by the last build()
     */
    [[nodiscard]] const pugi::xml_document& getDocument() const noexcept {
        return doc;
    }

    virtual ~IXmlBuilderBase() = default;
};
