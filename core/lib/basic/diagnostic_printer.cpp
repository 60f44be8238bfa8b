// stacksynth/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "stacksynth/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace stacksynth
{

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag)
{
  print_severity_header(diag);

  const Location primary = diag.primary_location();
  if (primary.is_valid()) {
    print_location_line(primary);
  }

  fmt::print(os_, "{}\n", gutter_pipe());

  const Label * primary_label = diag.primary_label();
  for (const auto & label : diag.labels) {
    if (&label == primary_label) {
      if (!label.message.empty()) {
        print_note(label.message);
      }
      continue;
    }
    print_secondary_label(label);
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags)
{
  std::vector<Diagnostic> sorted_diags;
  sorted_diags.reserve(diags.size());
  std::copy(diags.begin(), diags.end(), std::back_inserter(sorted_diags));

  // Errors before warnings, otherwise report order.
  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      return static_cast<int>(a.severity) < static_cast<int>(b.severity);
    });

  for (const auto & d : sorted_diags) {
    print(d);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

namespace
{

const char * severity_name(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
  }
  return "error";
}

}  // namespace

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
    }
    os_ << severity_name(diag.severity);
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
    return;
  }

  if (!diag.code.empty()) {
    fmt::print(os_, "{}[{}]: {}\n", severity_name(diag.severity), diag.code, diag.message);
  } else {
    fmt::print(os_, "{}: {}\n", severity_name(diag.severity), diag.message);
  }
}

std::string DiagnosticPrinter::describe(const Location & location)
{
  const std::string path = location.qualified_path();
  if (!location.has_file_position()) {
    return path;
  }

  std::error_code ec;
  auto rel_path =
    std::filesystem::relative(location.file, std::filesystem::current_path(), ec);
  const std::string filename = ec || rel_path.empty() ? location.file.string() : rel_path.string();

  std::string out = fmt::format("{}:{}:{}", filename, location.line, location.column);
  if (!path.empty()) {
    out += fmt::format(" ({})", path);
  }
  return out;
}

void DiagnosticPrinter::print_location_line(const Location & location)
{
  fmt::print(os_, "{} {}\n", gutter_arrow(), describe(location));
}

void DiagnosticPrinter::print_secondary_label(const Label & label)
{
  std::string text = describe(label.location);
  if (!label.message.empty()) {
    text = text.empty() ? label.message : text + ": " + label.message;
  }
  if (!text.empty()) {
    print_note(text);
  }
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "      = help: {}\n", message);
  }
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "      = note: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

}  // namespace stacksynth
