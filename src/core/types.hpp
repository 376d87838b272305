#ifndef TRIAGEGUARD_CORE_TYPES_HPP
#define TRIAGEGUARD_CORE_TYPES_HPP

#include <string>
#include <vector>
#include <chrono>
#include <cstddef>
#include <stdexcept>

/**
 * @file types.hpp
 * @brief Shared vocabulary: namespaces, entity types, spans and mapping records.
 */

namespace triageguard {
namespace core {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Pipeline stage a mapping was recorded in. Each has its own retention window.
 */
enum class Namespace {
    IncomingInput = 0,
    OutgoingToolArguments,
    ToolResults,
    FinalOutput
};

inline std::string NamespaceName(Namespace ns)
{
    switch (ns) {
    case Namespace::IncomingInput:         return "incoming_input";
    case Namespace::OutgoingToolArguments: return "outgoing_tool_arguments";
    case Namespace::ToolResults:           return "tool_results";
    case Namespace::FinalOutput:           return "final_output";
    }
    return "unknown";
}

inline bool ParseNamespace(const std::string &name, Namespace &out)
{
    for (Namespace ns : {Namespace::IncomingInput, Namespace::OutgoingToolArguments,
                         Namespace::ToolResults, Namespace::FinalOutput}) {
        if (NamespaceName(ns) == name) {
            out = ns;
            return true;
        }
    }
    return false;
}

/**
 * @brief Fixed lookup precedence used when restoring at a tool boundary.
 */
inline const std::vector<Namespace> &ToolBoundaryRestoreOrder()
{
    static const std::vector<Namespace> order = {
        Namespace::OutgoingToolArguments,
        Namespace::IncomingInput,
        Namespace::ToolResults,
        Namespace::FinalOutput
    };
    return order;
}

enum class EntityType {
    Secret = 0,
    TicketKey,
    Host,
    Email,
    IpAddress,
    Phone
};

/**
 * @brief Overlap-resolution class. Higher value wins.
 */
enum class EntityClass {
    PersonalIdentifier = 0,
    StructuredIdentifier = 1,
    DomainIdentifier = 2,
    Secret = 3
};

inline EntityClass ClassOf(EntityType type)
{
    switch (type) {
    case EntityType::Secret:    return EntityClass::Secret;
    case EntityType::TicketKey: return EntityClass::DomainIdentifier;
    case EntityType::Host:      return EntityClass::StructuredIdentifier;
    case EntityType::Email:
    case EntityType::IpAddress:
    case EntityType::Phone:     return EntityClass::PersonalIdentifier;
    }
    return EntityClass::PersonalIdentifier;
}

inline int PriorityOf(EntityType type)
{
    return static_cast<int>(ClassOf(type));
}

/**
 * @brief Upper-case tag used inside placeholders, e.g. <<TICKET_3fa9...>>.
 */
inline std::string EntityTypeTag(EntityType type)
{
    switch (type) {
    case EntityType::Secret:    return "SECRET";
    case EntityType::TicketKey: return "TICKET";
    case EntityType::Host:      return "HOST";
    case EntityType::Email:     return "EMAIL";
    case EntityType::IpAddress: return "IP";
    case EntityType::Phone:     return "PHONE";
    }
    return "UNKNOWN";
}

inline bool ParseEntityTypeTag(const std::string &tag, EntityType &out)
{
    for (EntityType t : {EntityType::Secret, EntityType::TicketKey, EntityType::Host,
                         EntityType::Email, EntityType::IpAddress, EntityType::Phone}) {
        if (EntityTypeTag(t) == tag) {
            out = t;
            return true;
        }
    }
    return false;
}

/**
 * @struct EntitySpan
 * @brief Half-open byte range [start, end) of a recognized entity.
 */
struct EntitySpan
{
    size_t start = 0;
    size_t end = 0;
    EntityType type = EntityType::Email;
    double confidence = 1.0;

    size_t Length() const { return end - start; }

    bool Overlaps(size_t otherStart, size_t otherEnd) const
    {
        return start < otherEnd && otherStart < end;
    }
};

inline bool operator==(const EntitySpan &a, const EntitySpan &b)
{
    return a.start == b.start && a.end == b.end && a.type == b.type;
}

/**
 * @struct MappingRecord
 * @brief One placeholder <-> original mapping, scoped to (session, namespace).
 */
struct MappingRecord
{
    std::string session;
    Namespace ns = Namespace::IncomingInput;
    EntityType type = EntityType::Email;
    std::string placeholder;
    std::string original;
    TimePoint createdAt;
};

/// Literal that replaces every secret-class match. Never stored, never restorable.
inline const std::string &RedactionLiteral()
{
    static const std::string literal = "[REDACTED_SECRET]";
    return literal;
}

} // namespace core
} // namespace triageguard

#endif // TRIAGEGUARD_CORE_TYPES_HPP
