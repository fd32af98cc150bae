// Tests for XML message encoding and decoding.
#include "emotiva/errors.h"
#include "emotiva/xml_codec.h"

#include <gtest/gtest.h>

#include <string>
#include <variant>

namespace {

const std::string kDeclaration = "<?xml version=\"1.0\" encoding=\"utf-8\"?>";

bool StartsWith(const std::string& text, const std::string& prefix) {
  return text.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

TEST(XmlCodecTest, EncodeCommandKeepsNameAndAck) {
  const std::string payload = emotiva::EncodeCommand("power_on");
  EXPECT_TRUE(StartsWith(payload, kDeclaration));

  const emotiva::XmlElement root = emotiva::Decode(payload);
  EXPECT_EQ(root.tag, emotiva::kControlTag);
  ASSERT_EQ(root.children.size(), 1u);
  const emotiva::XmlElement& command = root.children[0];
  EXPECT_EQ(command.tag, "power_on");
  EXPECT_EQ(command.Attribute("value").value_or(""), "0");
  EXPECT_EQ(command.Attribute("ack").value_or(""), "yes");
}

TEST(XmlCodecTest, EncodeCommandOrdersValueFirstAndAckLast) {
  const std::string payload =
      emotiva::EncodeCommand("volume", {{"value", "-20.5"}, {"zone", "main"}});
  const emotiva::XmlElement root = emotiva::Decode(payload);
  ASSERT_EQ(root.children.size(), 1u);
  const auto& attributes = root.children[0].attributes;
  ASSERT_EQ(attributes.size(), 3u);
  EXPECT_EQ(attributes[0].first, "value");
  EXPECT_EQ(attributes[0].second, "-20.5");
  EXPECT_EQ(attributes[1].first, "zone");
  EXPECT_EQ(attributes[2].first, "ack");
}

TEST(XmlCodecTest, EncodeCommandStructHonoursAckFlag) {
  emotiva::Command command;
  command.name = "mute_on";
  command.ack = false;
  const emotiva::XmlElement root = emotiva::Decode(emotiva::EncodeCommand(command));
  ASSERT_EQ(root.children.size(), 1u);
  EXPECT_EQ(root.children[0].Attribute("ack").value_or(""), "no");
  EXPECT_EQ(root.children[0].Attribute("value").value_or(""), "0");
}

TEST(XmlCodecTest, ProtocolAttributeOnlyFromVersionThree) {
  const emotiva::ProtocolVersion v2{2, 0};
  const emotiva::ProtocolVersion v31{3, 1};

  const emotiva::XmlElement legacy = emotiva::Decode(emotiva::EncodeUpdate({"power"}, v2));
  EXPECT_EQ(legacy.tag, emotiva::kUpdateTag);
  EXPECT_FALSE(legacy.Attribute("protocol").has_value());

  const emotiva::XmlElement tagged = emotiva::Decode(emotiva::EncodeSubscribe({"power"}, v31));
  EXPECT_EQ(tagged.tag, emotiva::kSubscriptionTag);
  EXPECT_EQ(tagged.Attribute("protocol").value_or(""), "3.1");
  ASSERT_EQ(tagged.children.size(), 1u);
  EXPECT_EQ(tagged.children[0].tag, "power");
}

TEST(XmlCodecTest, UnsubscribeNeverCarriesProtocol) {
  const emotiva::XmlElement root =
      emotiva::Decode(emotiva::EncodeUnsubscribe({"power", "volume"}));
  EXPECT_EQ(root.tag, emotiva::kUnsubscribeTag);
  EXPECT_FALSE(root.Attribute("protocol").has_value());
  EXPECT_EQ(root.children.size(), 2u);
}

TEST(XmlCodecTest, PingOffersVersion) {
  const emotiva::XmlElement root = emotiva::Decode(emotiva::EncodePing({3, 1}));
  EXPECT_EQ(root.tag, emotiva::kPingTag);
  EXPECT_EQ(root.Attribute("protocol").value_or(""), "3.1");
}

TEST(XmlCodecTest, DecodeRejectsGarbage) {
  EXPECT_THROW(emotiva::Decode(""), emotiva::MalformedMessageError);
  EXPECT_THROW(emotiva::Decode("   \n"), emotiva::MalformedMessageError);
  EXPECT_THROW(emotiva::Decode("<emotivaNotify><power>"), emotiva::MalformedMessageError);
  EXPECT_THROW(emotiva::Decode("not xml at all"), emotiva::MalformedMessageError);
}

TEST(XmlCodecTest, LegacyAndTaggedShapesExtractTheSameMap) {
  const emotiva::XmlElement legacy = emotiva::Decode(
      kDeclaration + "<emotivaNotify><power>On</power><volume value=\"-20.5\"/></emotivaNotify>");
  const emotiva::XmlElement tagged = emotiva::Decode(
      kDeclaration +
      "<emotivaNotify><property name=\"power\" value=\"On\"/>"
      "<property name=\"volume\" value=\"-20.5\"/></emotivaNotify>");

  EXPECT_TRUE(std::holds_alternative<emotiva::LegacyFormat>(emotiva::ClassifyProperties(legacy)));
  EXPECT_TRUE(std::holds_alternative<emotiva::TaggedFormat>(emotiva::ClassifyProperties(tagged)));

  const emotiva::PropertyMap expected{{"power", "On"}, {"volume", "-20.5"}};
  EXPECT_EQ(emotiva::ExtractProperties(legacy), expected);
  EXPECT_EQ(emotiva::ExtractProperties(tagged), expected);
}

TEST(XmlCodecTest, LegacyTextWinsOverValueAttribute) {
  const emotiva::XmlElement root = emotiva::Decode(
      kDeclaration + "<emotivaNotify><source value=\"ignored\">HDMI 1</source></emotivaNotify>");
  EXPECT_EQ(emotiva::ExtractProperties(root).at("source"), "HDMI 1");
}

TEST(XmlCodecTest, TaggedValueAttributeWinsOverText) {
  const emotiva::XmlElement root = emotiva::Decode(
      kDeclaration +
      "<emotivaNotify><property name=\"source\" value=\"HDMI 2\">stale</property>"
      "</emotivaNotify>");
  EXPECT_EQ(emotiva::ExtractProperties(root).at("source"), "HDMI 2");
}

TEST(XmlCodecTest, NamelessPropertyIsSkippedInAnyPosition) {
  const std::string bodies[] = {
      "<property value=\"x\"/><property name=\"power\" value=\"On\"/>",
      "<property name=\"power\" value=\"On\"/><property value=\"x\"/>",
      "<property name=\"\" value=\"x\"/><property name=\"power\" value=\"On\"/>",
  };
  for (const auto& body : bodies) {
    const emotiva::XmlElement root =
        emotiva::Decode(kDeclaration + "<emotivaNotify>" + body + "</emotivaNotify>");
    const emotiva::PropertyMap properties = emotiva::ExtractProperties(root);
    EXPECT_EQ(properties.size(), 1u) << body;
    EXPECT_EQ(properties.count("power"), 1u) << body;
  }
}

TEST(XmlCodecTest, NotificationCarriesSequence) {
  const emotiva::XmlElement root = emotiva::Decode(
      kDeclaration + "<emotivaNotify sequence=\"42\"><power>On</power></emotivaNotify>");
  const emotiva::Notification notification = emotiva::ExtractNotification(root);
  ASSERT_TRUE(notification.sequence.has_value());
  EXPECT_EQ(*notification.sequence, 42u);
  EXPECT_EQ(notification.properties.at("power"), "On");
}

TEST(XmlCodecTest, SubscriptionResultsKeepOnlyAcknowledgedEntries) {
  const emotiva::XmlElement legacy = emotiva::Decode(
      kDeclaration +
      "<emotivaSubscription><power status=\"ack\" value=\"On\" visible=\"true\"/>"
      "<bogus status=\"fail\"/></emotivaSubscription>");
  const emotiva::SubscriptionMap legacy_results = emotiva::ExtractSubscriptionResults(legacy);
  ASSERT_EQ(legacy_results.size(), 1u);
  EXPECT_EQ(legacy_results.at("power").value, "On");
  EXPECT_TRUE(legacy_results.at("power").visible);

  const emotiva::XmlElement tagged = emotiva::Decode(
      kDeclaration +
      "<emotivaSubscription protocol=\"3.1\">"
      "<property name=\"volume\" status=\"ack\" value=\"-20.5\" visible=\"false\"/>"
      "<property status=\"ack\" value=\"1\"/></emotivaSubscription>");
  const emotiva::SubscriptionMap tagged_results = emotiva::ExtractSubscriptionResults(tagged);
  ASSERT_EQ(tagged_results.size(), 1u);
  EXPECT_EQ(tagged_results.at("volume"), (emotiva::PropertyState{"-20.5", false}));
}

TEST(XmlCodecTest, ParsesTransponder) {
  const emotiva::XmlElement root = emotiva::Decode(
      kDeclaration +
      "<emotivaTransponder><model>XMC-2</model><revision>3.1</revision>"
      "<name>Living Room</name><control><version>3.1</version>"
      "<controlPort>7002</controlPort><notifyPort>7003</notifyPort>"
      "<infoPort>7004</infoPort><menuNotifyPort>7005</menuNotifyPort>"
      "<setupPortTCP>7100</setupPortTCP><setupXMLVersion>11</setupXMLVersion>"
      "<keepAlive>10000</keepAlive></control></emotivaTransponder>");
  const emotiva::Transponder transponder = emotiva::ParseTransponder(root, "10.0.0.5");
  EXPECT_EQ(transponder.model, "XMC-2");
  EXPECT_EQ(transponder.revision, "3.1");
  EXPECT_EQ(transponder.device_name, "Living Room");
  EXPECT_EQ(transponder.version, (emotiva::ProtocolVersion{3, 1}));
  EXPECT_EQ(transponder.ports.at(emotiva::PortRole::kControl), 7002);
  EXPECT_EQ(transponder.ports.at(emotiva::PortRole::kNotify), 7003);
  EXPECT_EQ(transponder.ports.at(emotiva::PortRole::kSetup), 7100);
  ASSERT_TRUE(transponder.keepalive_interval.has_value());
  EXPECT_EQ(transponder.keepalive_interval->count(), 10000);
  EXPECT_EQ(transponder.setup_xml_version.value_or(0), 11);
  EXPECT_EQ(transponder.source_address, "10.0.0.5");
}

TEST(XmlCodecTest, TransponderWithoutVersionDefaultsToOne) {
  const emotiva::XmlElement root = emotiva::Decode(
      kDeclaration +
      "<emotivaTransponder><model>XMC-1</model><control>"
      "<controlPort>7002</controlPort><notifyPort>7003</notifyPort>"
      "</control></emotivaTransponder>");
  const emotiva::Transponder transponder = emotiva::ParseTransponder(root, "");
  EXPECT_EQ(transponder.version, (emotiva::ProtocolVersion{1, 0}));
  EXPECT_FALSE(transponder.keepalive_interval.has_value());
}

TEST(XmlCodecTest, TransponderMissingPortsIsRejected) {
  const emotiva::XmlElement no_notify = emotiva::Decode(
      kDeclaration +
      "<emotivaTransponder><control><controlPort>7002</controlPort></control>"
      "</emotivaTransponder>");
  EXPECT_THROW(emotiva::ParseTransponder(no_notify, ""), emotiva::DiscoveryError);

  const emotiva::XmlElement wrong_root =
      emotiva::Decode(kDeclaration + "<emotivaAck/>");
  EXPECT_THROW(emotiva::ParseTransponder(wrong_root, ""), emotiva::DiscoveryError);
}
