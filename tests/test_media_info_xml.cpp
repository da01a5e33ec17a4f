#include <gtest/gtest.h>
#include "../main/src/exception.hpp"
#include "../main/src/localization.hpp"
#include "../main/src/media_info_xml.hpp"
#include <filesystem>

namespace fs = std::filesystem;

class MediaInfoXmlTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_localization();
    }

    std::shared_ptr<const PackageFields> make_package(const std::string& name, bool with_sourcerpm = true) {
        auto f = std::make_shared<PackageFields>();
        f->name = name;
        if (with_sourcerpm) f->sourcerpm = name + ".src.rpm";
        f->url = "https://example.org/?a=1&b=2";
        f->license = "GPLv2+";
        f->description = "Uses <angle> brackets";
        f->files = {"/usr/bin/" + name, "/usr/share/doc/" + name};
        f->changelog = {{1700000000, "Jane <jane@example.org> 1.0-1", "- first release"}};
        return f;
    }
};

TEST_F(MediaInfoXmlTest, Escape) {
    EXPECT_EQ(xml_escape("a & b < c > \"d\" 'e'"), "a &amp; b &lt; c &gt; &quot;d&quot; &apos;e&apos;");
    EXPECT_EQ(xml_escape("plain"), "plain");
}

TEST_F(MediaInfoXmlTest, FilesDocument) {
    MediaInfoXmlWriter writer;
    writer.add(make_package("foo"));
    EXPECT_EQ(writer.files_document(),
              "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n<media_info>"
              "<files fn=\"foo\">\n/usr/bin/foo\n/usr/share/doc/foo\n</files>\n"
              "</media_info>");
}

TEST_F(MediaInfoXmlTest, InfoDocument) {
    MediaInfoXmlWriter writer;
    writer.add(make_package("foo"));
    EXPECT_EQ(writer.info_document(),
              "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n<media_info>"
              "<info fn=\"foo\" sourcerpm=\"foo.src.rpm\" url=\"https://example.org/?a=1&amp;b=2\" license=\"GPLv2+\">"
              "Uses &lt;angle&gt; brackets</info>\n"
              "</media_info>");
}

TEST_F(MediaInfoXmlTest, ChangelogDocument) {
    MediaInfoXmlWriter writer;
    writer.add(make_package("foo"));
    EXPECT_EQ(writer.changelog_document(),
              "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n<media_info>"
              "<changelogs fn=\"foo\">\n"
              "<log time=\"1700000000\">\n"
              "<log_name>Jane &lt;jane@example.org&gt; 1.0-1</log_name>\n"
              "<log_text>- first release</log_text>\n"
              "</log>\n"
              "</changelogs>\n"
              "</media_info>");
}

TEST_F(MediaInfoXmlTest, EmptyWriter) {
    MediaInfoXmlWriter writer;
    EXPECT_EQ(writer.document(XmlDocument::Files), "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n<media_info></media_info>");
    EXPECT_EQ(writer.size(), 0u);
}

TEST_F(MediaInfoXmlTest, MissingSourcerpmOnlyFailsInfo) {
    MediaInfoXmlWriter writer;
    writer.add(make_package("good"));
    writer.add(make_package("nosrc", false));

    EXPECT_THROW(writer.info_document(), MissingFieldError);
    EXPECT_NO_THROW(writer.files_document());
    EXPECT_NO_THROW(writer.changelog_document());
}

TEST_F(MediaInfoXmlTest, PackagesKeepInsertionOrder) {
    MediaInfoXmlWriter writer;
    writer.add(make_package("zeta"));
    writer.add(make_package("alpha"));
    std::string doc = writer.files_document();
    EXPECT_LT(doc.find("fn=\"zeta\""), doc.find("fn=\"alpha\""));
}

TEST_F(MediaInfoXmlTest, DuplicatePackage) {
    MediaInfoXmlWriter writer;
    writer.add(make_package("foo"));
    EXPECT_THROW(writer.add(make_package("foo")), DuplicatePackageError);
    EXPECT_EQ(writer.size(), 1u);
}

TEST_F(MediaInfoXmlTest, DocumentNames) {
    EXPECT_EQ(xml_document_name(XmlDocument::Files), "files");
    EXPECT_EQ(xml_document_name(XmlDocument::Info), "info");
    EXPECT_EQ(xml_document_name(XmlDocument::Changelog), "changelog");
}
