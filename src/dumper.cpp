#include <dumper.hpp>
#include <child_slots.hpp>
#include <ast.hpp>

#include <fmt/format.h>

#include <sstream>

namespace ktree
{

std::string escape(std::string_view text)
{
  std::string result;
  result.reserve(text.size());
  for(char c : text)
  {
    switch(c)
    {
    case '\b': result += "\\b"; break;
    case '\n': result += "\\n"; break;
    case '\r': result += "\\r"; break;
    case '\t': result += "\\t"; break;
    case '"': result += "\\\""; break;
    case '\\': result += "\\\\"; break;
    default: result += c; break;
    }
  }
  return result;
}

dumper::dumper(std::ostream& os, const extras_map* extras, bool verbose)
  : os(os), extras(extras), verbose(verbose)
{  }

std::string dumper::dump(const node_ptr& root, const extras_map* extras, bool verbose)
{
  std::stringstream ss;
  dumper d(ss, extras, verbose);
  d.print(root);
  return ss.str();
}

void dumper::print(const node_ptr& root)
{
  traverse(root);
}

void dumper::visit(const node_path& path)
{
  const auto depth = path.depth();
  const bool has_parent = path.parent != nullptr;

  if(extras != nullptr && has_parent)
    write_extras(extras->before(path.node), depth, "BEFORE: ");
  write_line(path.node, depth);

  visit_children(path);

  if(extras != nullptr)
  {
    write_extras(extras->within(path.node), depth + 1, "WITHIN: ");
    if(has_parent)
      write_extras(extras->after(path.node), depth, "AFTER: ");
  }
}

void dumper::write_extras(const extra_list& list, std::size_t depth, const char* prefix)
{
  for(auto& e : list)
    write_line(e, depth, prefix);
}

void dumper::write_line(const node_ptr& node, std::size_t depth, const char* prefix)
{
  os << fmt::format("{:{}}{}{}", "", depth * 2, prefix, kind_name(node->kind));
  if(node->kind == node_kind::keyword)
    os << "." << as<keyword>(node)->text();
  if(verbose)
  {
    auto attributes = node_attributes(node);
    if(!attributes.empty())
    {
      std::string joined;
      for(auto& a : attributes)
      {
        if(!joined.empty())
          joined += ", ";
        joined += fmt::format("{}=\"{}\"", a.key, escape(a.value));
      }
      os << "{" << joined << "}";
    }
  }
  os << "\n";
}

}
