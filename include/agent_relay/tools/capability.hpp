#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace agent_relay {

enum class CapabilityKind {
    Shell,
    FileRead,
    FileWrite,
    WebSearch,
    MediaMarker,
    RemoteBridge,
};

const char* CapabilityKindName(CapabilityKind kind);

// ---------------------------------------------------------------------------
// CapabilityDescriptor: what the model sees: name, description and the JSON
// Schema of the input object.
// ---------------------------------------------------------------------------
struct CapabilityDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
};

// ---------------------------------------------------------------------------
// ICapability: one tool the model can invoke.
//
// Execute never throws on expected failures; every failure is reported as a
// textual result the model reads like any other output.
// ---------------------------------------------------------------------------
class ICapability {
public:
    virtual ~ICapability() = default;

    [[nodiscard]] virtual CapabilityKind Kind() const = 0;
    [[nodiscard]] virtual CapabilityDescriptor Describe() const = 0;

    /// Static policy, used when the input does not matter.
    [[nodiscard]] virtual bool AlwaysNeedsApproval() const { return false; }

    /// Policy for one concrete invocation.
    [[nodiscard]] virtual bool NeedsApproval(const nlohmann::json& input) const {
        (void)input;
        return AlwaysNeedsApproval();
    }

    /// Text shown to the human when approval is requested.
    [[nodiscard]] virtual std::string ApprovalDescription(const nlohmann::json& input) const;

    virtual std::string Execute(const nlohmann::json& input) = 0;

    ICapability(const ICapability&) = delete;
    ICapability& operator=(const ICapability&) = delete;

protected:
    ICapability() = default;
};

/// input[key] as a string, or fallback when missing or not a string.
std::string StringField(const nlohmann::json& input, const char* key,
                        const std::string& fallback = "");

/// First `limit` bytes of text without splitting a UTF-8 sequence.
std::string Utf8Prefix(const std::string& text, std::size_t limit);

} // namespace agent_relay
