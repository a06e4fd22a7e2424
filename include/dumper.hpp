#pragma once

#include <visitor.hpp>
#include <extras_map.hpp>
#include <config.hpp>

#include <ostream>
#include <string>
#include <string_view>

namespace ktree
{

// Prints one line per node, indented two spaces per level, e.g.
//
//   kotlin_file
//     declaration.property_declaration
//       keyword{text="val"}
//
// Extras are printed around their node with BEFORE:, WITHIN: and AFTER:
// prefixes. Verbose mode appends the scalar attributes of each node.
class dumper : public visitor
{
public:
  dumper(std::ostream& os, const extras_map* extras = nullptr, bool verbose = config.dump_verbose);

  static std::string dump(const node_ptr& root, const extras_map* extras = nullptr,
                          bool verbose = config.dump_verbose);

  void print(const node_ptr& root);
protected:
  void visit(const node_path& path) override;
private:
  void write_line(const node_ptr& node, std::size_t depth, const char* prefix = "");
  void write_extras(const extra_list& list, std::size_t depth, const char* prefix);

  std::ostream& os;
  const extras_map* extras;
  bool verbose;
};

// Escapes \b \n \r \t " and \ for display.
std::string escape(std::string_view text);

}
