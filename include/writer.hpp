#pragma once

#include <visitor.hpp>
#include <extras_map.hpp>

#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace ktree
{

// Turns a tree back into source text. With an extras map the original
// trivia is written around every node; without one (or in addition to it,
// in heuristic mode) spaces, newlines and semicolons are inserted wherever
// the text would otherwise change meaning.
class writer : public visitor
{
public:
  using space_rule = std::function<bool(char last, char next)>;
  using newline_rule = std::function<bool(const node_path& path)>;
  using separator_rule = std::function<bool(const node_path& child, const node_ptr& next)>;

  explicit writer(std::ostream& os, const extras_map* extras = nullptr);

  static std::string write(const node_ptr& root, const extras_map* extras = nullptr);

  // Writes `root` to the stream, starting from a clean heuristic state.
  void print(const node_ptr& root);
protected:
  void visit(const node_path& path) override;

  void append(std::string_view text);
  void do_append(std::string_view text);

  // Rules are tried in order, the first match wins.
  std::vector<space_rule> space_rules;
  std::vector<newline_rule> newline_rules;
  std::vector<separator_rule> separator_rules;

  std::ostream& os;
  const extras_map* extras;
private:
  void write_content(const node_path& path);

  void write_extras_before(const node_path& path);
  void write_extras_within(const node_path& path);
  void write_extras_after(const node_path& path);
  void write_extras(const extra_list& list);

  void write_heuristic_newline(const node_path& path);
  void write_heuristic_space();
  void write_separator_after(const node_path& child, const node_ptr& next);

  template<typename T>
  void children(const node_path& path, const list_of<T>& list, std::string_view sep = {});

  template<typename T>
  void delimited(const node_path& path, std::string_view open, const list_of<T>& list,
                 const node_ptr& comma, std::string_view close);

  void block(const node_path& path, const node_list& statements);
  void label(const std::string& text);

  bool heuristics_enabled() const;
  bool extras_contain_newline_or_semicolon() const;
  bool extras_contain_semicolon() const;

  extra_list extras_since_last;
  bool space_requested { false };
  char last_char { '\0' };
  std::vector<bool> within_written;
};

}
