// tests/test_mime_parser.cpp
#include <gtest/gtest.h>

#include "ingest_errors.hpp"
#include "mime_parser.hpp"

using namespace MailIngest;
using namespace MailIngest::Mail;

TEST(MimeParserTest, ParsesCoreHeaders) {
    const std::string raw =
        "Message-ID: <abc@example.com>\n"
        "From: \"Doe, Jane\" <Jane.Doe@Example.COM>\n"
        "To: bob@example.com, Carol <carol@example.com>\n"
        "Cc: dave@example.com (Dave D)\n"
        "Subject: Quarterly\n"
        " numbers\n"
        "Date: Tue, 2 Jan 2024 09:30:00 +0000\n"
        "In-Reply-To: <parent@example.com>\n"
        "References: <root@example.com>\n"
        "\t<parent@example.com>\n"
        "X-GM-THRID: 1234567890\n"
        "\n"
        "Hello there.\n";

    ParsedMessage m = MimeParser::parseMessage(raw);
    EXPECT_EQ(m.message_id, "<abc@example.com>");
    EXPECT_EQ(m.from.email, "jane.doe@example.com");
    ASSERT_TRUE(m.from.name.has_value());
    EXPECT_EQ(*m.from.name, "Doe, Jane");
    ASSERT_EQ(m.to.size(), 2u);
    EXPECT_EQ(m.to[1].email, "carol@example.com");
    ASSERT_EQ(m.cc.size(), 1u);
    EXPECT_EQ(m.cc[0].email, "dave@example.com");
    EXPECT_EQ(m.subject, "Quarterly numbers");
    EXPECT_EQ(formatIso8601(m.date), "2024-01-02T09:30:00Z");
    EXPECT_EQ(m.in_reply_to.value_or(""), "<parent@example.com>");
    ASSERT_EQ(m.references.size(), 2u);
    EXPECT_EQ(m.references[0], "<root@example.com>");
    EXPECT_EQ(m.transport_thread_id.value_or(""), "1234567890");
    EXPECT_EQ(m.body_text.value_or(""), "Hello there.\n");
    EXPECT_FALSE(m.body_html.has_value());
    EXPECT_EQ(m.headers.at("subject").size(), 1u);
}

TEST(MimeParserTest, FillsFallbacksForMissingHeaders) {
    ParsedMessage m = MimeParser::parseMessage("Subject: bare\n\nbody\n");
    EXPECT_EQ(m.message_id.rfind("<generated-", 0), 0u);
    EXPECT_NE(m.message_id.find("@synthetic>"), std::string::npos);
    EXPECT_EQ(m.from.email, "unknown@unknown.com");
    EXPECT_TRUE(m.references.empty());
    EXPECT_FALSE(m.in_reply_to.has_value());
    EXPECT_FALSE(m.transport_thread_id.has_value());
}

TEST(MimeParserTest, SyntheticIdsAreUnique) {
    EXPECT_NE(MimeParser::syntheticMessageId(), MimeParser::syntheticMessageId());
}

TEST(MimeParserTest, MessageIdListsAreBracketed) {
    auto ids = MimeParser::parseMessageIdList("<a@x>\n <b@y>");
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids[0], "<a@x>");
    EXPECT_EQ(ids[1], "<b@y>");

    auto bare = MimeParser::parseMessageIdList("lone@x");
    ASSERT_EQ(bare.size(), 1u);
    EXPECT_EQ(bare[0], "<lone@x>");
    EXPECT_TRUE(MimeParser::parseMessageIdList("").empty());
}

TEST(MimeParserTest, AddressGroupsAreFlattened) {
    auto addresses = MimeParser::parseAddressList("Team: a@x.com, B <b@x.com>;, c@x.com");
    ASSERT_EQ(addresses.size(), 3u);
    EXPECT_EQ(addresses[0].email, "a@x.com");
    EXPECT_EQ(addresses[1].name.value_or(""), "B");
    EXPECT_EQ(addresses[2].email, "c@x.com");
}

TEST(MimeParserTest, MultipartBodiesAndAttachments) {
    const std::string raw =
        "Message-ID: <mp@example.com>\n"
        "From: a@example.com\n"
        "Date: Tue, 2 Jan 2024 09:30:00 +0000\n"
        "Content-Type: multipart/mixed; boundary=\"outer\"\n"
        "\n"
        "preamble\n"
        "--outer\n"
        "Content-Type: multipart/alternative; boundary=inner\n"
        "\n"
        "--inner\n"
        "Content-Type: text/plain\n"
        "\n"
        "plain body\n"
        "--inner\n"
        "Content-Type: text/html\n"
        "\n"
        "<p>html body</p>\n"
        "--inner--\n"
        "--outer\n"
        "Content-Type: application/pdf; name=\"q3.pdf\"\n"
        "Content-Disposition: attachment; filename=\"q3.pdf\"\n"
        "Content-Transfer-Encoding: base64\n"
        "\n"
        "QUJD\n"
        "--outer\n"
        "Content-Type: image/png\n"
        "Content-Disposition: inline\n"
        "Content-ID: <logo@example.com>\n"
        "\n"
        "iVBO\n"
        "--outer--\n";

    ParsedMessage m = MimeParser::parseMessage(raw);
    EXPECT_EQ(m.body_text.value_or(""), "plain body");
    EXPECT_EQ(m.body_html.value_or(""), "<p>html body</p>");
    ASSERT_EQ(m.attachments.size(), 2u);
    EXPECT_EQ(m.attachments[0].filename, "q3.pdf");
    EXPECT_EQ(m.attachments[0].content_type, "application/pdf");
    EXPECT_EQ(m.attachments[0].size_bytes, 4u);
    EXPECT_FALSE(m.attachments[0].is_inline);
    EXPECT_EQ(m.attachments[1].filename, "unnamed");
    EXPECT_TRUE(m.attachments[1].is_inline);
    EXPECT_EQ(m.attachments[1].content_id.value_or(""), "<logo@example.com>");
}

TEST(MimeParserTest, RejectsMalformedBlocks) {
    EXPECT_THROW(MimeParser::parseMessage(""), MessageParseError);
    EXPECT_THROW(MimeParser::parseMessage("\nbody only\n"), MessageParseError);
    EXPECT_THROW(MimeParser::parseMessage("this line has no colon\n\nbody\n"), MessageParseError);
    EXPECT_THROW(MimeParser::parseMessage("Subject: x\nContent-Type: multipart/mixed\n\nbody\n"),
                 MessageParseError);
}

TEST(MimeParserTest, AttachmentNamesComeFromDispositionOrContentType) {
    const std::string raw =
        "Message-ID: <names@example.com>\n"
        "From: a@example.com\n"
        "Content-Type: multipart/mixed; boundary=b\n"
        "\n"
        "--b\n"
        "Content-Type: text/plain\n"
        "Content-Disposition: attachment; filename=\"a; b.txt\"\n"
        "\n"
        "quoted\n"
        "--b\n"
        "Content-Type: application/pdf\n"
        "Content-Disposition: attachment; filename*=utf-8''report.pdf\n"
        "\n"
        "%PDF\n"
        "--b\n"
        "Content-Type: image/gif; name=\"dot.gif\"\n"
        "\n"
        "GIF8\n"
        "--b--\n";

    ParsedMessage m = MimeParser::parseMessage(raw);
    EXPECT_FALSE(m.body_text.has_value());
    ASSERT_EQ(m.attachments.size(), 3u);
    EXPECT_EQ(m.attachments[0].filename, "a; b.txt");
    EXPECT_EQ(m.attachments[0].content_type, "text/plain");
    EXPECT_EQ(m.attachments[1].filename, "report.pdf");
    EXPECT_EQ(m.attachments[2].filename, "dot.gif");
    EXPECT_EQ(m.attachments[2].content_type, "image/gif");
}
