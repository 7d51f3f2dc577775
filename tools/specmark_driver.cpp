#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include "specmark/clause_builder.hpp"
#include "specmark/diagnostics_json.hpp"
#include "specmark/edn.hpp"

using namespace specmark;

static std::string read_file(const std::string& path){ std::ifstream ifs(path); std::stringstream ss; ss<<ifs.rdbuf(); return ss.str(); }

static void print_outline(const Clause& c, int indent){
    std::cout << std::string(indent*2, ' ');
    auto label = c.secnum_label();
    if(!label.empty()) std::cout << label << " ";
    std::cout << c.title;
    if(c.aoid) std::cout << "  [" << *c.aoid << "]";
    std::cout << "\n";
    for(auto& p : c.preamble) std::cout << std::string(indent*2+4, ' ') << p << "\n";
    for(auto& sub : c.subclauses) print_outline(*sub, indent+1);
}

int main(int argc, char** argv){
    if(argc<2){ std::cerr << "usage: specmark_driver <document.edn> [--biblio]\n"; return 1; }
    std::string file = argv[1];
    bool biblio = argc>2 && std::string(argv[2]) == "--biblio";
    std::string src = read_file(file); if(src.empty()){ std::cerr << "failed to read " << file << "\n"; return 1; }

    CompileContext ctx(CompileOptions::from_env());
    doc::document d;
    try {
        d = doc::load_document(std::move(src), file);
        compile_document(d, ctx);
    } catch (const edn::parse_error& e) {
        std::cerr << file << ":" << e.line << ":" << e.col << ": " << e.what() << "\n"; return 2;
    } catch (const doc::document_error& e) {
        std::cerr << file << ":" << e.line << ":" << e.col << ": " << e.what() << "\n"; return 2;
    } catch (const clause_error& e) {
        std::cerr << file << ": " << e.what() << "\n"; return 3;
    }

    for(auto& c : ctx.clauses) print_outline(*c, 0);
    for(auto& dg : ctx.diagnostics)
        std::cerr << file << ":" << dg.line << ":" << dg.col << ": warning: " << dg.message << " [" << dg.rule_id << "]\n";
    if(biblio) std::cout << biblio_to_json(ctx.biblio) << "\n";
    return ctx.diagnostics.empty() ? 0 : 4;
}
