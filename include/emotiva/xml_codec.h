#pragma once

#include "emotiva/types.h"

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace emotiva {

/**
 * Root element names used on the wire.
 */
constexpr const char kPingTag[] = "emotivaPing";
constexpr const char kTransponderTag[] = "emotivaTransponder";
constexpr const char kControlTag[] = "emotivaControl";
constexpr const char kAckTag[] = "emotivaAck";
constexpr const char kUpdateTag[] = "emotivaUpdate";
constexpr const char kNotifyTag[] = "emotivaNotify";
constexpr const char kSubscriptionTag[] = "emotivaSubscription";
constexpr const char kUnsubscribeTag[] = "emotivaUnsubscribe";
constexpr const char kPropertyTag[] = "property";

/**
 * Decoded XML element, detached from the parser.
 */
struct XmlElement {
  std::string tag;
  /// Attributes in document order.
  std::vector<std::pair<std::string, std::string>> attributes;
  /// Concatenated direct text content.
  std::string text;
  std::vector<XmlElement> children;

  /// Attribute value, if present.
  std::optional<std::string> Attribute(const std::string& name) const;
  /// First direct child with the given tag, or nullptr.
  const XmlElement* Child(const std::string& tag) const;
  /// Text content, or nullopt when empty or whitespace-only.
  std::optional<std::string> Text() const;
};

/// Each child is named after its property (protocol 2.x and earlier).
struct LegacyFormat {
  const XmlElement* root = nullptr;
};

/// Each child is a `property` element with `name`/`value` attributes (3.x).
struct TaggedFormat {
  const XmlElement* root = nullptr;
};

using PropertyShape = std::variant<LegacyFormat, TaggedFormat>;

/// Encode a control command inside an emotivaControl envelope.
std::string EncodeCommand(const std::string& name,
                          const std::map<std::string, std::string>& attributes = {});
std::string EncodeCommand(const Command& command);

/// Encode a property poll request.
std::string EncodeUpdate(const std::vector<std::string>& names,
                         const ProtocolVersion& version);

/// Encode a subscription request.
std::string EncodeSubscribe(const std::vector<std::string>& names,
                            const ProtocolVersion& version);

/// Encode an unsubscribe request (never carries a protocol attribute).
std::string EncodeUnsubscribe(const std::vector<std::string>& names);

/// Encode a discovery ping offering the given protocol version.
std::string EncodePing(const ProtocolVersion& version);

/**
 * Parse a datagram into an element tree.
 *
 * @throws MalformedMessageError if the payload is not well-formed XML.
 */
XmlElement Decode(const std::string& payload);

/// Decide once which property representation a message uses.
PropertyShape ClassifyProperties(const XmlElement& root);

/// Extract property values from either representation.
PropertyMap ExtractProperties(const XmlElement& root);

/// Extract sequence number and properties of an emotivaNotify message.
Notification ExtractNotification(const XmlElement& root);

/// Extract the acknowledged entries of a subscription/unsubscribe reply.
SubscriptionMap ExtractSubscriptionResults(const XmlElement& root);

/**
 * Interpret an emotivaTransponder element.
 *
 * @throws DiscoveryError if the root tag or mandatory ports are missing.
 */
Transponder ParseTransponder(const XmlElement& root, const std::string& source_address);

}  // namespace emotiva
