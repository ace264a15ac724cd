#include "CookieJar.hpp"
#include "Errors.hpp"
#include "HttpsClient.hpp"
#include "Multipart.hpp"
#include "SubmissionClient.hpp"
#include "TestDoubles.hpp"
#include "UploadResponsePage.hpp"

#include <cassert>
#include <print>

using namespace std::chrono;

namespace {

const system_clock::time_point now = sys_days{ 2026y / October / 19 } + 18h + 20min;

const std::string download_url = "https://awesome-hd.me/torrents.php";

std::string row(const std::string& id, const std::string& added, const std::string& owner) {
    return "<tr class=\"torrent\" id=\"torrent_" + id + "\">\n"
           "  <td><span title=\"" + added + "\">recently</span> <span title=\"Jan 01 2000, 00:00\">x</span></td>\n"
           "  <td><div><a href=\"user.php?id=" + owner + "\">uploader</a></div></td>\n"
           "</tr>\n";
}

std::string page(const std::string& rows) {
    return "<html><head>\n"
           "<script type=\"text/javascript\">\n"
           "var userid = 42;\n"
           "var authkey = \"abc123\";\n"
           "if (n < 3) { document.write(\"<tr id='torrent_9'><a href=user.php?id=42>\"); }\n"
           "</script></head><body>\n"
           "<!-- <tr id=\"torrent_8\"> -->\n"
           "<a href=\"feeds.php?feed=torrents&passkey=PASS&amp;auth=1\">RSS</a>\n"
           "<table>\n" + rows + "</table></body></html>\n";
}

template <typename E, typename F>
void expect_throw(F&& f) {
    bool thrown = false;
    try { f(); }
    catch (const E&) { thrown = true; }
    assert(thrown);
}

void TestRowTimestamp() {
    assert(parse_row_timestamp("Oct 19 2026, 18:20") == sys_days{ 2026y / October / 19 } + 18h + 20min);
    assert(parse_row_timestamp("Jan 02 2025, 07:05") == sys_days{ 2025y / January / 2 } + 7h + 5min);
    assert(!parse_row_timestamp("yesterday"));
    assert(!parse_row_timestamp(""));
}

void TestParsePage() {
    auto html = page(
        row("1001", "Oct 19 2026, 18:19", "42") +
        "<tr id=\"torrent_1003_details\"><td>no owner here</td></tr>\n"
        "<tr id=\"torrent_abc\"><td><a href=\"user.php?id=42\">x</a></td></tr>\n");

    auto p = parse_upload_response(html);
    assert(p.user_id == "42");
    assert(p.authkey == "abc123");
    assert(p.passkey == "PASS");

    assert(p.rows.size() == 2);
    assert(p.rows[0].id == "1001");
    assert(p.rows[0].owner_id == "42");
    assert(p.rows[0].added == sys_days{ 2026y / October / 19 } + 18h + 19min);
    assert(p.rows[1].id == "1003");
    assert(!p.rows[1].owner_id);
    assert(!p.rows[1].added);

    expect_throw<LinkExtractionError>([] { parse_upload_response("<html>var userid = 42;</html>"); });
    expect_throw<LinkExtractionError>([] { parse_upload_response("<html>Duplicate torrent</html>"); });
}

void TestSelectsNewestOwnedRow() {
    auto html = page(
        row("1000", "Oct 19 2026, 18:10", "42") +
        row("1002", "Oct 19 2026, 18:20", "7") +
        row("1001", "Oct 19 2026, 18:19", "42"));

    auto link = extract_download_link(html, now, 2min, download_url);
    assert(link == "https://awesome-hd.me/torrents.php?action=download&id=1001&authkey=abc123&torrent_pass=PASS");
}

void TestRecencyWindow() {
    // the newest owned row must be within the window on either side of now
    expect_throw<LinkExtractionError>([] {
        extract_download_link(page(row("1000", "Oct 19 2026, 18:15", "42")), now, 2min, download_url);
    });
    expect_throw<LinkExtractionError>([] {
        extract_download_link(page(row("1000", "Oct 19 2026, 18:18", "42")), now, 2min, download_url);
    });

    auto ahead = extract_download_link(page(row("1004", "Oct 19 2026, 18:21", "42")), now, 2min, download_url);
    assert(ahead.contains("id=1004"));

    // someone else's upload is never ours
    expect_throw<LinkExtractionError>([] {
        extract_download_link(page(row("1002", "Oct 19 2026, 18:20", "7")), now, 2min, download_url);
    });
}

void TestCookieJar() {
    auto jar = CookieJar::parse(
        "# Netscape HTTP Cookie File\n"
        "\n"
        "#HttpOnly_.awesome-hd.me\tTRUE\t/\tTRUE\t0\tsession\tabc\r\n"
        "awesome-hd.me\tFALSE\t/\tFALSE\t4102444800\tuid\t42\n"
        "awesome-hd.me\tFALSE\t/\tFALSE\t1000\told\tgone\n"
        "awesome-hd.me\tFALSE\t/forums\tFALSE\t0\tforum\tx\n"
        "img.awesome-hd.me\tFALSE\t/\tFALSE\t0\timg\ty\n"
        "example.com\tFALSE\t/\tFALSE\t0\tother\tz\n");

    assert(jar.cookies().size() == 6);
    assert(jar.cookies()[0].http_only);
    assert(jar.cookies()[0].domain == ".awesome-hd.me");

    assert(jar.header_for("awesome-hd.me", "/upload.php", true, now) == "session=abc; uid=42");
    assert(jar.header_for("AWESOME-HD.ME", "/upload.php", false, now) == "uid=42");
    assert(jar.header_for("img.awesome-hd.me", "/api/upload", true, now) == "session=abc; img=y");
    assert(jar.header_for("awesome-hd.me", "/forums/thread", true, now) == "session=abc; uid=42; forum=x");
    assert(jar.header_for("awesome-hd.me", "/forumsx", true, now) == "session=abc; uid=42");
    assert(jar.header_for("notawesome-hd.me", "/", true, now).empty());

    auto six = CookieJar::parse("awesome-hd.me\tFALSE\t/\tFALSE\t0\tempty\n");
    assert(six.cookies().size() == 1 && six.cookies()[0].value.empty());

    expect_throw<CookieFileError>([] { CookieJar::parse("awesome-hd.me\tFALSE\t/\n"); });
    expect_throw<CookieFileError>([] { CookieJar::parse("awesome-hd.me\tyes\t/\tFALSE\t0\ta\tb\n"); });
    expect_throw<CookieFileError>([] { CookieJar::parse("awesome-hd.me\tFALSE\t/\tFALSE\tsoon\ta\tb\n"); });
    expect_throw<CookieFileError>([] { CookieJar::load(scratch_dir("cookies_missing") / "cookies.txt"); });
}

void TestMultipartBody() {
    MultipartBody body("XYZ");
    body.add_field("a", "1");
    body.add_file("f", "x\"y.torrent", std::string("D\0T", 3), "application/x-bittorrent");

    assert(body.content_type() == "multipart/form-data; boundary=XYZ");
    assert(body.finish() ==
        "--XYZ\r\nContent-Disposition: form-data; name=\"a\"\r\n\r\n1\r\n"
        "--XYZ\r\nContent-Disposition: form-data; name=\"f\"; filename=\"x%22y.torrent\"\r\n"
        "Content-Type: application/x-bittorrent\r\n\r\n" + std::string("D\0T", 3) + "\r\n"
        "--XYZ--\r\n");

    MultipartBody first, second;
    assert(first.boundary().starts_with("----ahd-uploader-"));
    assert(first.boundary() != second.boundary());
}

void TestRedirects() {
    boost::urls::url current("https://awesome-hd.me/upload.php");
    auto method = http::verb::post;
    bool with_body = true;

    auto next = next_hop(current, 303, "/torrents.php?id=5", method, with_body);
    assert(next && next->buffer() == "https://awesome-hd.me/torrents.php?id=5");
    assert(method == http::verb::get && !with_body);

    method = http::verb::post;
    with_body = true;
    next = next_hop(current, 307, "https://tracker.awesome-hd.me/upload.php", method, with_body);
    assert(next && next->buffer() == "https://tracker.awesome-hd.me/upload.php");
    assert(method == http::verb::post && with_body);

    next = next_hop(current, 308, "upload2.php", method, with_body);
    assert(next && next->buffer() == "https://awesome-hd.me/upload2.php");
    assert(method == http::verb::post && with_body);

    // relative locations resolve against the directory of the current url
    boost::urls::url nested("https://awesome-hd.me/forums/upload/index.php?x=1");
    next = next_hop(nested, 302, "../done.php", method, with_body);
    assert(next && next->buffer() == "https://awesome-hd.me/forums/done.php");
    assert(method == http::verb::get && !with_body);

    method = http::verb::post;
    with_body = true;
    assert(!next_hop(current, 302, "", method, with_body));
    assert(!next_hop(current, 200, "/elsewhere.php", method, with_body));
    assert(!next_hop(current, 304, "/elsewhere.php", method, with_body));
    assert(method == http::verb::post && with_body);

    expect_throw<NetworkError>([&] { next_hop(current, 301, "https://[bad", method, with_body); });
}

UploadForm sample_form() {
    return UploadForm(UploadForm::Fields{
        { "submit", FormValue{ std::string("true") } },
        { "type", FormValue{ std::string("Movies") } },
        { "file_input", FormValue{ FileBlob{ "Movie.torrent", "TORRENT" } } }
    });
}

void TestSubmission() {
    UploaderConfig config;
    auto jar = CookieJar::parse(".awesome-hd.me\tTRUE\t/\tTRUE\t0\tsession\tabc\n");

    FakeTransport transport;
    transport.handler = [](const HttpRequest&) {
        return HttpResponse{ 200, page(row("1001", "Oct 19 2026, 18:19", "42")), "text/html", "", "https://awesome-hd.me/torrents.php?id=77" };
    };

    SubmissionClient client(transport, config, [] { return now; });
    auto result = client.upload(sample_form(), jar);

    assert(result.direct_link);
    assert(result.status == 200);
    assert(result.url == "https://awesome-hd.me/torrents.php?action=download&id=1001&authkey=abc123&torrent_pass=PASS");

    assert(transport.requests.size() == 1);
    const auto& req = transport.requests[0];
    assert(req.method == HttpMethod::Post);
    assert(req.url == "https://awesome-hd.me/upload.php");
    assert(req.cookies == &jar);
    assert(req.content_type.starts_with("multipart/form-data; boundary="));
    assert(req.body.contains("name=\"file_input\"; filename=\"Movie.torrent\"\r\nContent-Type: application/x-bittorrent\r\n\r\nTORRENT\r\n"));
    assert(req.body.contains("name=\"type\"\r\n\r\nMovies\r\n"));

    // parts go out in form order
    assert(req.body.find("name=\"submit\"") < req.body.find("name=\"type\""));
    assert(req.body.find("name=\"type\"") < req.body.find("name=\"file_input\""));
}

void TestSubmissionFallsBackToLandingPage() {
    UploaderConfig config;
    CookieJar jar;

    FakeTransport transport;
    transport.handler = [](const HttpRequest&) {
        return HttpResponse{ 200, "<html>The torrent is a duplicate</html>", "text/html", "", "https://awesome-hd.me/upload.php" };
    };

    SubmissionClient client(transport, config, [] { return now; });
    auto result = client.upload(sample_form(), jar);

    assert(!result.direct_link);
    assert(result.url == "https://awesome-hd.me/upload.php");

    // a stale upload on an otherwise valid page is not ours either
    transport.handler = [](const HttpRequest&) {
        return HttpResponse{ 200, page(row("1000", "Oct 19 2026, 18:15", "42")), "text/html", "", "https://awesome-hd.me/torrents.php" };
    };
    result = client.upload(sample_form(), jar);
    assert(!result.direct_link);
    assert(result.url == "https://awesome-hd.me/torrents.php");
}

void TestSubmissionRejected() {
    UploaderConfig config;
    CookieJar jar;

    FakeTransport transport;
    transport.handler = [](const HttpRequest& req) { return HttpResponse{ 500, "oops", "text/plain", "", req.url }; };

    SubmissionClient client(transport, config, [] { return now; });
    try {
        client.upload(sample_form(), jar);
        assert(false);
    }
    catch (const SubmissionError& ex) {
        assert(ex.status() == 500);
        assert(std::string(ex.what()).contains("500"));
    }
}

}

int main() {
    TestRowTimestamp();
    TestParsePage();
    TestSelectsNewestOwnedRow();
    TestRecencyWindow();
    TestCookieJar();
    TestMultipartBody();
    TestRedirects();
    TestSubmission();
    TestSubmissionFallsBackToLandingPage();
    TestSubmissionRejected();

    std::println("submission_test passed");
    return 0;
}
