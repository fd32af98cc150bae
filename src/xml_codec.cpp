#include "emotiva/xml_codec.h"
#include "emotiva/errors.h"

#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>

#include <upnp/ixml.h>

namespace emotiva {
namespace {

constexpr char kXmlDeclaration[] = "<?xml version=\"1.0\" encoding=\"utf-8\"?>";
constexpr char kAckYes[] = "yes";
constexpr char kAckNo[] = "no";
constexpr char kDefaultCommandValue[] = "0";
constexpr char kStatusAck[] = "ack";

struct DocumentDeleter {
  void operator()(IXML_Document* doc) const {
    if (doc) {
      ixmlDocument_free(doc);
    }
  }
};

using DocumentPtr = std::unique_ptr<IXML_Document, DocumentDeleter>;

bool IsBlank(const std::string& text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
}

std::string Trim(const std::string& text) {
  const auto first = std::find_if_not(text.begin(), text.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  const auto last = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();
  if (first >= last) {
    return {};
  }
  return std::string(first, last);
}

// Thin builder over an ixml document: one root, flat children.
class MessageBuilder {
 public:
  explicit MessageBuilder(const std::string& root_tag)
      : doc_(ixmlDocument_createDocument()) {
    if (!doc_) {
      throw Error("ixml: failed to allocate document");
    }
    root_ = CreateElement(root_tag);
    Append(&doc_->n, &root_->n);
  }

  void SetRootAttribute(const std::string& name, const std::string& value) {
    SetAttribute(root_, name, value);
  }

  IXML_Element* AddChild(const std::string& tag) {
    IXML_Element* child = CreateElement(tag);
    Append(&root_->n, &child->n);
    return child;
  }

  void SetAttribute(IXML_Element* element, const std::string& name,
                    const std::string& value) {
    if (ixmlElement_setAttribute(element, name.c_str(), value.c_str()) != IXML_SUCCESS) {
      throw Error("ixml: failed to set attribute '" + name + "'");
    }
  }

  std::string Serialize() const {
    DOMString text = ixmlNodetoString(&root_->n);
    if (!text) {
      throw Error("ixml: failed to serialize message");
    }
    std::string out(kXmlDeclaration);
    out += text;
    ixmlFreeDOMString(text);
    return out;
  }

 private:
  IXML_Element* CreateElement(const std::string& tag) {
    if (tag.empty()) {
      throw std::invalid_argument("element name must not be empty");
    }
    IXML_Element* element = ixmlDocument_createElement(doc_.get(), tag.c_str());
    if (!element) {
      throw Error("ixml: failed to create element '" + tag + "'");
    }
    return element;
  }

  void Append(IXML_Node* parent, IXML_Node* child) {
    if (ixmlNode_appendChild(parent, child) != IXML_SUCCESS) {
      throw Error("ixml: failed to append element");
    }
  }

  DocumentPtr doc_;
  IXML_Element* root_ = nullptr;
};

std::string EncodePropertyList(const char* root_tag,
                               const std::vector<std::string>& names,
                               const std::optional<ProtocolVersion>& version) {
  MessageBuilder builder(root_tag);
  if (version.has_value() && version->UsesTaggedProperties()) {
    builder.SetRootAttribute("protocol", version->ToString());
  }
  for (const auto& name : names) {
    builder.AddChild(name);
  }
  return builder.Serialize();
}

std::string NodeString(const char* value) {
  return value ? std::string(value) : std::string();
}

// Copy an ixml element subtree into an XmlElement value.
XmlElement ConvertElement(IXML_Node* node) {
  XmlElement element;
  element.tag = NodeString(ixmlNode_getNodeName(node));

  IXML_NamedNodeMap* attributes = ixmlNode_getAttributes(node);
  if (attributes) {
    const unsigned long count = ixmlNamedNodeMap_getLength(attributes);
    for (unsigned long i = 0; i < count; ++i) {
      IXML_Node* attr = ixmlNamedNodeMap_item(attributes, i);
      if (!attr) {
        continue;
      }
      element.attributes.emplace_back(NodeString(ixmlNode_getNodeName(attr)),
                                      NodeString(ixmlNode_getNodeValue(attr)));
    }
    ixmlNamedNodeMap_free(attributes);
  }

  for (IXML_Node* child = ixmlNode_getFirstChild(node); child != nullptr;
       child = ixmlNode_getNextSibling(child)) {
    switch (ixmlNode_getNodeType(child)) {
      case eELEMENT_NODE:
        element.children.push_back(ConvertElement(child));
        break;
      case eTEXT_NODE:
      case eCDATA_SECTION_NODE:
        element.text += NodeString(ixmlNode_getNodeValue(child));
        break;
      default:
        break;
    }
  }
  return element;
}

std::optional<uint16_t> ParsePort(const std::string& text) {
  try {
    size_t used = 0;
    const unsigned long value = std::stoul(text, &used);
    if (used != text.size() || value == 0 || value > 0xffff) {
      return std::nullopt;
    }
    return static_cast<uint16_t>(value);
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

std::optional<long> ParseInteger(const std::string& text) {
  try {
    size_t used = 0;
    const long value = std::stol(text, &used);
    if (used != text.size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

std::optional<std::string> ChildText(const XmlElement& parent, const char* tag) {
  const XmlElement* child = parent.Child(tag);
  if (!child) {
    return std::nullopt;
  }
  return child->Text();
}

// Legacy elements: text content wins over the value attribute.
std::optional<std::string> LegacyValue(const XmlElement& element) {
  auto text = element.Text();
  if (text.has_value()) {
    return text;
  }
  return element.Attribute("value");
}

// Tagged elements: the value attribute wins over text content.
std::optional<std::string> TaggedValue(const XmlElement& element) {
  auto value = element.Attribute("value");
  if (value.has_value()) {
    return value;
  }
  return element.Text();
}

PropertyMap ExtractFrom(const LegacyFormat& shape) {
  PropertyMap properties;
  for (const auto& child : shape.root->children) {
    auto value = LegacyValue(child);
    if (value.has_value()) {
      properties[child.tag] = *value;
    }
  }
  return properties;
}

PropertyMap ExtractFrom(const TaggedFormat& shape) {
  PropertyMap properties;
  for (const auto& child : shape.root->children) {
    if (child.tag != kPropertyTag) {
      continue;
    }
    auto name = child.Attribute("name");
    if (!name.has_value() || name->empty()) {
      continue;
    }
    auto value = TaggedValue(child);
    if (value.has_value()) {
      properties[*name] = *value;
    }
  }
  return properties;
}

void AddSubscriptionEntry(SubscriptionMap& results, const std::string& name,
                          const XmlElement& element,
                          const std::optional<std::string>& value) {
  if (element.Attribute("status").value_or("") != kStatusAck) {
    return;
  }
  PropertyState state;
  state.value = value.value_or("");
  state.visible = element.Attribute("visible").value_or("") == "true";
  results[name] = state;
}

}  // namespace

std::optional<std::string> XmlElement::Attribute(const std::string& name) const {
  for (const auto& attribute : attributes) {
    if (attribute.first == name) {
      return attribute.second;
    }
  }
  return std::nullopt;
}

const XmlElement* XmlElement::Child(const std::string& child_tag) const {
  for (const auto& child : children) {
    if (child.tag == child_tag) {
      return &child;
    }
  }
  return nullptr;
}

std::optional<std::string> XmlElement::Text() const {
  if (text.empty() || IsBlank(text)) {
    return std::nullopt;
  }
  return Trim(text);
}

std::string EncodeCommand(const std::string& name,
                          const std::map<std::string, std::string>& attributes) {
  MessageBuilder builder(kControlTag);
  IXML_Element* element = builder.AddChild(name);
  auto value = attributes.find("value");
  builder.SetAttribute(element, "value",
                       value != attributes.end() ? value->second : kDefaultCommandValue);
  for (const auto& attribute : attributes) {
    if (attribute.first == "value" || attribute.first == "ack") {
      continue;
    }
    builder.SetAttribute(element, attribute.first, attribute.second);
  }
  auto ack = attributes.find("ack");
  builder.SetAttribute(element, "ack", ack != attributes.end() ? ack->second : kAckYes);
  return builder.Serialize();
}

std::string EncodeCommand(const Command& command) {
  std::map<std::string, std::string> attributes = command.attributes;
  if (command.value.has_value()) {
    attributes["value"] = *command.value;
  }
  attributes["ack"] = command.ack ? kAckYes : kAckNo;
  return EncodeCommand(command.name, attributes);
}

std::string EncodeUpdate(const std::vector<std::string>& names,
                         const ProtocolVersion& version) {
  return EncodePropertyList(kUpdateTag, names, version);
}

std::string EncodeSubscribe(const std::vector<std::string>& names,
                            const ProtocolVersion& version) {
  return EncodePropertyList(kSubscriptionTag, names, version);
}

std::string EncodeUnsubscribe(const std::vector<std::string>& names) {
  return EncodePropertyList(kUnsubscribeTag, names, std::nullopt);
}

std::string EncodePing(const ProtocolVersion& version) {
  MessageBuilder builder(kPingTag);
  builder.SetRootAttribute("protocol", version.ToString());
  return builder.Serialize();
}

XmlElement Decode(const std::string& payload) {
  if (payload.empty() || IsBlank(payload)) {
    throw MalformedMessageError("empty datagram");
  }
  IXML_Document* raw = nullptr;
  const int rc = ixmlParseBufferEx(payload.c_str(), &raw);
  DocumentPtr doc(raw);
  if (rc != IXML_SUCCESS || !doc) {
    throw MalformedMessageError("invalid XML (ixml error " + std::to_string(rc) + ")");
  }
  for (IXML_Node* node = ixmlNode_getFirstChild(&doc->n); node != nullptr;
       node = ixmlNode_getNextSibling(node)) {
    if (ixmlNode_getNodeType(node) == eELEMENT_NODE) {
      return ConvertElement(node);
    }
  }
  throw MalformedMessageError("XML document has no root element");
}

PropertyShape ClassifyProperties(const XmlElement& root) {
  const bool tagged = std::any_of(root.children.begin(), root.children.end(),
                                  [](const XmlElement& child) {
                                    return child.tag == kPropertyTag;
                                  });
  if (tagged) {
    return TaggedFormat{&root};
  }
  return LegacyFormat{&root};
}

PropertyMap ExtractProperties(const XmlElement& root) {
  return std::visit([](const auto& shape) { return ExtractFrom(shape); },
                    ClassifyProperties(root));
}

Notification ExtractNotification(const XmlElement& root) {
  Notification notification;
  auto sequence = root.Attribute("sequence");
  if (sequence.has_value()) {
    auto parsed = ParseInteger(*sequence);
    if (parsed.has_value() && *parsed >= 0) {
      notification.sequence = static_cast<uint64_t>(*parsed);
    }
  }
  notification.properties = ExtractProperties(root);
  return notification;
}

SubscriptionMap ExtractSubscriptionResults(const XmlElement& root) {
  SubscriptionMap results;
  const PropertyShape shape = ClassifyProperties(root);
  if (std::holds_alternative<TaggedFormat>(shape)) {
    for (const auto& child : root.children) {
      if (child.tag != kPropertyTag) {
        continue;
      }
      auto name = child.Attribute("name");
      if (!name.has_value() || name->empty()) {
        continue;
      }
      AddSubscriptionEntry(results, *name, child, TaggedValue(child));
    }
  } else {
    for (const auto& child : root.children) {
      AddSubscriptionEntry(results, child.tag, child, LegacyValue(child));
    }
  }
  return results;
}

Transponder ParseTransponder(const XmlElement& root, const std::string& source_address) {
  if (root.tag != kTransponderTag) {
    throw DiscoveryError("unexpected discovery response: " + root.tag);
  }
  Transponder transponder;
  transponder.source_address = source_address;
  transponder.model = ChildText(root, "model").value_or("");
  transponder.revision = ChildText(root, "revision").value_or("");
  transponder.device_name = ChildText(root, "name").value_or("");

  const XmlElement* control = root.Child("control");
  if (!control) {
    throw DiscoveryError("transponder response has no control section");
  }
  transponder.version = ProtocolVersion::Parse(ChildText(*control, "version").value_or("1.0"));

  const PortRole roles[] = {PortRole::kControl, PortRole::kNotify, PortRole::kInfo,
                            PortRole::kMenuNotify, PortRole::kSetup};
  for (PortRole role : roles) {
    auto text = ChildText(*control, PortRoleName(role));
    if (!text.has_value()) {
      continue;
    }
    auto port = ParsePort(*text);
    if (!port.has_value()) {
      throw DiscoveryError(std::string("transponder has invalid ") + PortRoleName(role) +
                           ": " + *text);
    }
    transponder.ports[role] = *port;
  }
  if (transponder.ports.count(PortRole::kControl) == 0 ||
      transponder.ports.count(PortRole::kNotify) == 0) {
    throw DiscoveryError("transponder response is missing controlPort or notifyPort");
  }

  auto keepalive = ChildText(*control, "keepAlive");
  if (keepalive.has_value()) {
    auto parsed = ParseInteger(*keepalive);
    if (parsed.has_value() && *parsed > 0) {
      transponder.keepalive_interval = std::chrono::milliseconds(*parsed);
    }
  }
  auto setup_version = ChildText(*control, "setupXMLVersion");
  if (setup_version.has_value()) {
    auto parsed = ParseInteger(*setup_version);
    if (parsed.has_value()) {
      transponder.setup_xml_version = static_cast<int>(*parsed);
    }
  }
  return transponder;
}

}  // namespace emotiva
