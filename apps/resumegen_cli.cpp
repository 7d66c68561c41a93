#include "resumegen/config.hpp"
#include "resumegen/content.hpp"
#include "resumegen/error.hpp"
#include "resumegen/generator.hpp"
#include "resumegen/logging.hpp"
#include "resumegen/response_validator.hpp"
#include "resumegen/utils/values.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct CliArguments {
  std::string brief;
  std::optional<std::string> brief_file;
  std::string accent;
  std::string model;
  std::optional<int> max_tokens;
  std::optional<double> temperature;
  std::vector<std::string> attachments;
  std::optional<std::string> avatar;
  std::optional<std::string> qr_code;
  std::string system_prompt = "prompts/system_prompt.txt";
  std::optional<std::string> output;
  bool include_accent_hint = true;
  std::optional<long long> deadline_ms;
};

class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

void print_usage(std::ostream& out) {
  out << "Usage: resumegen_cli (--brief TEXT | --brief-file PATH) [options]\n"
      << "  --accent #RRGGBB        accent color (default from config)\n"
      << "  --model NAME            model identifier\n"
      << "  --max-tokens N          output token budget\n"
      << "  --temperature T         sampling temperature\n"
      << "  --attach PATH           context file (repeatable, PNG/JPEG/WebP/PDF)\n"
      << "  --avatar PATH           profile photo embedded in the result\n"
      << "  --qr PATH               QR code embedded in the result\n"
      << "  --system-prompt PATH    system instruction file\n"
      << "  --out PATH              write the HTML here instead of stdout\n"
      << "  --no-accent-hint        do not mention the accent color in the prompt\n"
      << "  --timeout-ms N          overall deadline for the generation\n";
}

std::string read_text_file(const std::string& path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    throw resumegen::ResumeGenError(resumegen::ErrorKind::FileNotFound, "Could not open " + path);
  }
  std::ostringstream buffer;
  buffer << input.rdbuf();
  return buffer.str();
}

template <typename T>
T parse_number(const std::string& flag, const std::string& value) {
  std::istringstream stream(value);
  T parsed{};
  stream >> parsed;
  if (stream.fail() || !stream.eof()) {
    throw UsageError(flag + " expects a number, got '" + value + "'");
  }
  return parsed;
}

CliArguments parse_arguments(int argc, char** argv) {
  CliArguments args;
  for (int i = 1; i < argc; ++i) {
    const std::string flag = argv[i];
    auto next = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw UsageError(flag + " expects a value");
      }
      return argv[++i];
    };

    if (flag == "--brief") {
      args.brief = next();
    } else if (flag == "--brief-file") {
      args.brief_file = next();
    } else if (flag == "--accent") {
      args.accent = next();
    } else if (flag == "--model") {
      args.model = next();
    } else if (flag == "--max-tokens") {
      args.max_tokens = parse_number<int>(flag, next());
    } else if (flag == "--temperature") {
      args.temperature = parse_number<double>(flag, next());
    } else if (flag == "--attach") {
      args.attachments.push_back(next());
    } else if (flag == "--avatar") {
      args.avatar = next();
    } else if (flag == "--qr") {
      args.qr_code = next();
    } else if (flag == "--system-prompt") {
      args.system_prompt = next();
    } else if (flag == "--out") {
      args.output = next();
    } else if (flag == "--no-accent-hint") {
      args.include_accent_hint = false;
    } else if (flag == "--timeout-ms") {
      args.deadline_ms = parse_number<long long>(flag, next());
    } else if (flag == "--help" || flag == "-h") {
      print_usage(std::cout);
      std::exit(0);
    } else {
      throw UsageError("Unknown option " + flag);
    }
  }
  return args;
}

}  // namespace

int main(int argc, char** argv) {
  CliArguments args;
  try {
    args = parse_arguments(argc, argv);
  } catch (const UsageError& error) {
    std::cerr << error.what() << "\n";
    print_usage(std::cerr);
    return kExitUsage;
  }

  try {
    const resumegen::GeneratorConfig config = resumegen::load_config_from_env();

    resumegen::GenerationInput input;
    input.brief = args.brief_file ? read_text_file(*args.brief_file) : args.brief;
    if (resumegen::utils::trim_view(input.brief).empty()) {
      std::cerr << "Enter a brief to generate the resume (--brief or --brief-file).\n";
      return kExitUsage;
    }
    input.system_instructions = resumegen::load_system_instructions(args.system_prompt);
    input.accent_color = args.accent.empty() ? config.default_accent_color : args.accent;
    input.model = args.model;
    input.max_tokens = args.max_tokens;
    input.temperature = args.temperature;
    input.include_accent_hint = args.include_accent_hint;
    for (const auto& path : args.attachments) {
      input.attachments.push_back(resumegen::load_attachment(path));
    }
    if (args.avatar) {
      input.avatar = resumegen::load_attachment(*args.avatar);
    }
    if (args.qr_code) {
      input.qr_code = resumegen::load_attachment(*args.qr_code);
    }

    resumegen::ClientOptions client_options = resumegen::make_client_options(config);
    client_options.log_level = resumegen::LogLevel::Info;
    client_options.logger = resumegen::make_stream_logger(std::cerr);

    resumegen::ResumeGenerator generator(config, std::move(client_options));

    resumegen::CancellationToken cancellation;
    if (args.deadline_ms) {
      cancellation = resumegen::CancellationToken::with_timeout(std::chrono::milliseconds(*args.deadline_ms));
    }

    resumegen::GenerationResult result = generator.generate(input, cancellation);

    std::optional<std::string> avatar_uri;
    std::optional<std::string> qr_uri;
    if (input.avatar) {
      avatar_uri = resumegen::to_data_uri(*input.avatar);
    }
    if (input.qr_code) {
      qr_uri = resumegen::to_data_uri(*input.qr_code);
    }
    const std::string html = resumegen::apply_image_overrides(result.html, avatar_uri, qr_uri);

    if (args.output) {
      resumegen::write_document(*args.output, html);
      std::cerr << "Wrote " << html.size() << " bytes to " << *args.output << " (" << result.model << ", "
                << result.attempts << " attempt(s), " << result.elapsed.count() << " ms)\n";
    } else {
      std::cout << html;
      if (!std::cout.flush()) {
        std::cerr << "Failed writing the document to stdout\n";
        return kExitFailure;
      }
    }
    return 0;
  } catch (const resumegen::ResumeGenError& error) {
    std::cerr << "Error generating the resume [" << resumegen::error_kind_name(error.kind()) << "]: " << error.what()
              << "\n"
              << resumegen::remediation_hint(error.kind()) << "\n";
    return kExitFailure;
  } catch (const std::exception& error) {
    std::cerr << "Error generating the resume: " << error.what() << "\n";
    return kExitFailure;
  }
}
