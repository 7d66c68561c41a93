#include "resumegen/error.hpp"

namespace resumegen {

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidColor:
      return "InvalidColor";
    case ErrorKind::BriefTooLong:
      return "BriefTooLong";
    case ErrorKind::UnsupportedModel:
      return "UnsupportedModel";
    case ErrorKind::UnsupportedFormat:
      return "UnsupportedFormat";
    case ErrorKind::PayloadTooLarge:
      return "PayloadTooLarge";
    case ErrorKind::RateLimited:
      return "RateLimited";
    case ErrorKind::ConnectionError:
      return "ConnectionError";
    case ErrorKind::Timeout:
      return "Timeout";
    case ErrorKind::AuthenticationFailed:
      return "AuthenticationFailed";
    case ErrorKind::QuotaExceeded:
      return "QuotaExceeded";
    case ErrorKind::MalformedRequest:
      return "MalformedRequest";
    case ErrorKind::RemoteError:
      return "RemoteError";
    case ErrorKind::UnexpectedResponse:
      return "UnexpectedResponse";
    case ErrorKind::RetriesExhausted:
      return "RetriesExhausted";
    case ErrorKind::InvalidHTMLResponse:
      return "InvalidHTMLResponse";
    case ErrorKind::Cancelled:
      return "Cancelled";
    case ErrorKind::Configuration:
      return "Configuration";
    case ErrorKind::FileNotFound:
      return "FileNotFound";
  }
  return "Unknown";
}

const char* remediation_hint(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidColor:
      return "Pick an accent color in #RRGGBB form.";
    case ErrorKind::BriefTooLong:
      return "Shorten the brief and try again.";
    case ErrorKind::UnsupportedModel:
      return "Choose one of the available models.";
    case ErrorKind::UnsupportedFormat:
      return "Upload PNG, JPEG or WebP images, or PDF documents.";
    case ErrorKind::PayloadTooLarge:
      return "File too large; upload a smaller file.";
    case ErrorKind::RateLimited:
      return "Rate limited, please retry shortly.";
    case ErrorKind::ConnectionError:
      return "Could not reach the generation service; check your connection.";
    case ErrorKind::Timeout:
      return "The generation service took too long to answer; try again.";
    case ErrorKind::AuthenticationFailed:
      return "Check that the API key is valid.";
    case ErrorKind::QuotaExceeded:
      return "The account quota is exhausted; review billing.";
    case ErrorKind::MalformedRequest:
      return "The request was rejected; review the inputs.";
    case ErrorKind::RemoteError:
      return "The generation service reported an error.";
    case ErrorKind::UnexpectedResponse:
      return "The generation service returned no usable text.";
    case ErrorKind::RetriesExhausted:
      return "The service kept failing; please retry in a few minutes.";
    case ErrorKind::InvalidHTMLResponse:
      return "The model did not return a complete HTML document; generate again.";
    case ErrorKind::Cancelled:
      return "Generation was cancelled.";
    case ErrorKind::Configuration:
      return "Check the API key and configuration files.";
    case ErrorKind::FileNotFound:
      return "Check the attachment and output paths.";
  }
  return "";
}

bool is_retryable(ErrorKind kind) {
  return kind == ErrorKind::RateLimited || kind == ErrorKind::ConnectionError ||
         kind == ErrorKind::Timeout;
}

}  // namespace resumegen
