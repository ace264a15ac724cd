#include "Errors.hpp"
#include "HttpsClient.hpp"
#include "ProcessRunner.hpp"
#include "Uploader.hpp"

#include <charconv>
#include <cstdio>
#include <map>
#include <optional>
#include <print>
#include <set>
#include <string>
#include <vector>

namespace {

constexpr std::string_view usage = R"(CLI uploader for AHD.

Usage:
    ahd_uploader (-h | --help)
    ahd_uploader prepare <media> <output_form> --imdb=<imdb> --passkey=<passkey>
        [--media-type=<media_type> --type=<type> --group=<group> --codec=<codec>]
        [--user-release --special-edition=<edition_information>]
        [--num-screens=<num_screens>]
    ahd_uploader examine <input_form>
    ahd_uploader upload <input_form> --cookies=<cookie_file> [--delete-on-success]

Options:
  <media>                 File or directory to create a torrent out of.
  <output_form>           Where to save the prepared upload form.
  --imdb=<imdb>           IMDb ID, not the full link, e.g. tt0113243.
  --passkey=<passkey>     Your AHD passkey (also your AIMG API key).
  --type=<type>           Movies or TV-Shows [default: AUTO-DETECT].
  --media-type=<m>        Blu-ray, HD-DVD, HDTV, WEB-DL, WEBRip, DTheater, XDCAM or UHD Blu-ray
                          [default: AUTO-DETECT].
  --codec=<codec>         x264, VC-1 Remux, h.264 Remux, MPEG2 Remux, h.265 Remux or x265
                          [default: AUTO-DETECT].
  --group=<group>         Release group, UNKNOWN for an unknown group [default: AUTO-DETECT].
  --user-release          Marks a user release.
  --special-edition=<e>   Edition name, if any.
  --num-screens=<n>       Number of screenshots in the description [default: 4].
  <input_form>            A previously prepared upload form.
  --cookies=<file>        Cookies in Netscape format, used to log in to AHD.
  --delete-on-success     Delete the form file once the upload was accepted.
)";

constexpr std::string_view auto_detect = "AUTO-DETECT";

struct CommandLine {
    std::string command;
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
    std::set<std::string> flags;

    std::optional<std::string> option(const std::string& name) const {
        auto it = options.find(name);
        if (it == options.end()) return std::nullopt;
        return it->second;
    }

    std::string required(const std::string& name) const {
        auto value = option(name);
        if (!value) throw UsageError("Missing required option --" + name);
        return *value;
    }
};

CommandLine parse_command_line(int argc, char** argv, const std::set<std::string>& flag_names) {
    CommandLine cl;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.starts_with("--")) {
            auto eq = arg.find('=');
            auto name = arg.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);

            if (flag_names.contains(name)) {
                if (eq != std::string::npos) throw UsageError("--" + name + " does not take a value");
                cl.flags.insert(name);
            }
            else if (eq != std::string::npos) cl.options[name] = arg.substr(eq + 1);
            else if (i + 1 < argc) cl.options[name] = argv[++i];
            else throw UsageError("Missing value for --" + name);
        }
        else if (cl.command.empty()) cl.command = arg;
        else cl.positional.push_back(arg);
    }

    return cl;
}

void check_known(const CommandLine& cl, const std::set<std::string>& allowed, size_t positional) {
    for (const auto& [name, value]: cl.options) {
        if (!allowed.contains(name)) throw UsageError("Unknown option --" + name + " for " + cl.command);
    }
    for (const auto& name: cl.flags) {
        if (!allowed.contains(name)) throw UsageError("Unknown option --" + name + " for " + cl.command);
    }
    if (cl.positional.size() != positional) throw UsageError("Wrong number of arguments for " + cl.command);
}

template <typename T, typename Parse>
Setting<T> parse_setting(const CommandLine& cl, const std::string& name, Parse parse) {
    auto value = cl.option(name);
    if (!value || *value == auto_detect) return AutoDetect{};

    auto parsed = parse(*value);
    if (!parsed) throw ValidationError("Invalid value '" + *value + "' for --" + name);
    return *parsed;
}

UploadAttributes parse_attributes(const CommandLine& cl) {
    UploadAttributes attributes;

    attributes.imdb = cl.required("imdb");
    attributes.passkey = cl.required("passkey");

    attributes.type = parse_setting<ContentType>(cl, "type", parse_content_type);
    attributes.media = parse_setting<MediaType>(cl, "media-type", parse_media_type);
    attributes.codec = parse_setting<Codec>(cl, "codec", parse_codec);
    attributes.group = parse_setting<std::string>(cl, "group", [](const std::string& g) { return std::optional<std::string>(g); });

    if (auto edition = cl.option("special-edition"); edition && !edition->empty()) attributes.special_edition = *edition;
    attributes.user_release = cl.flags.contains("user-release");

    if (auto screens = cl.option("num-screens")) {
        int n = 0;
        auto [ptr, ec] = std::from_chars(screens->data(), screens->data() + screens->size(), n);
        if (ec != std::errc{} || ptr != screens->data() + screens->size() || n <= 0) {
            throw ValidationError("--num-screens must be a positive integer, got '" + *screens + "'");
        }
        attributes.num_screens = n;
    }

    return attributes;
}

}

int main(int argc, char** argv) {
    try {
        auto cl = parse_command_line(argc, argv, { "user-release", "delete-on-success", "help" });

        if (cl.command.empty() || cl.command == "-h" || cl.flags.contains("help")) {
            std::print("{}", usage);
            return cl.command.empty() && !cl.flags.contains("help") ? 2 : 0;
        }

        UploaderConfig config;
        SystemProcessRunner runner;
        HttpsClient client(config);
        Uploader uploader(runner, client, config);

        if (cl.command == "prepare") {
            check_known(cl, { "imdb", "passkey", "media-type", "type", "group", "codec", "user-release", "special-edition", "num-screens" }, 2);
            uploader.prepare(cl.positional[0], cl.positional[1], parse_attributes(cl));
        }
        else if (cl.command == "examine") {
            check_known(cl, {}, 1);
            for (const auto& [name, value]: uploader.examine(cl.positional[0])) std::println("{}: {}", name, value);
        }
        else if (cl.command == "upload") {
            check_known(cl, { "cookies", "delete-on-success" }, 1);
            auto result = uploader.upload(cl.positional[0], cl.required("cookies"), cl.flags.contains("delete-on-success"));
            std::println("{}", result.url);
        }
        else {
            throw UsageError("Unknown command " + cl.command);
        }
    }

    catch (const UsageError& ex) {
        std::println(stderr, "{}\n", ex.what());
        std::print(stderr, "{}", usage);
        return 2;
    }

    catch (const std::exception& ex) {
        std::println(stderr, "{}", ex.what());
        return 1;
    }

    return 0;
}
