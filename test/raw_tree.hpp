#pragma once

#include <raw_element.hpp>

#include <memory>
#include <string>
#include <vector>

// A hand-built parse tree standing in for a real parser in tests.
namespace ktree::test
{

class raw_node : public raw_element
{
public:
  raw_node(std::string kind, raw_role role, std::string text = {})
    : kind_(std::move(kind)), role_(role), text_(std::move(text))
  {  }

  std::string_view kind() const override { return kind_; }
  raw_role role() const override { return role_; }
  std::string_view text() const override { return text_; }
  std::size_t offset() const override { return offset_; }

  std::size_t child_count() const override { return children.size(); }
  const raw_element& child(std::size_t i) const override { return *children.at(i); }

  raw_node& at(std::size_t i) { return *children.at(i); }

  void add(std::unique_ptr<raw_node> child) { children.push_back(std::move(child)); }

  // Lays out offsets and returns the concatenated source text of the subtree.
  std::string layout(std::size_t start = 0)
  {
    offset_ = start;
    if(children.empty())
      return text_;
    std::string result;
    for(auto& c : children)
      result += c->layout(start + result.size());
    text_ = result;
    return result;
  }
private:
  std::string kind_;
  raw_role role_;
  std::string text_;
  std::size_t offset_ { 0 };
  std::vector<std::unique_ptr<raw_node>> children;
};

using raw_ptr = std::unique_ptr<raw_node>;

template<typename... Children>
raw_ptr node(std::string kind, Children&&... children)
{
  auto n = std::make_unique<raw_node>(std::move(kind), raw_role::significant);
  (n->add(std::forward<Children>(children)), ...);
  return n;
}

inline raw_ptr leaf(std::string kind, std::string text)
{ return std::make_unique<raw_node>(std::move(kind), raw_role::significant, std::move(text)); }

inline raw_ptr tok(std::string text)
{ return std::make_unique<raw_node>("token", raw_role::token, std::move(text)); }

inline raw_ptr ws(std::string text)
{ return std::make_unique<raw_node>("whitespace", raw_role::whitespace, std::move(text)); }

inline raw_ptr cmt(std::string text)
{ return std::make_unique<raw_node>("comment", raw_role::comment, std::move(text)); }

inline raw_ptr semi()
{ return std::make_unique<raw_node>("semicolon", raw_role::semicolon, ";"); }

}
