#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include "tinyc/compiler.hpp"
#include "tinyc/diagnostics_json.hpp"
#include "tinyc/dump.hpp"

using namespace tinyc;

static bool read_input(const std::string& path, std::string& out){
    std::stringstream ss;
    if(path.empty() || path == "-"){ ss << std::cin.rdbuf(); out = ss.str(); return true; }
    std::ifstream ifs(path);
    if(!ifs) return false;
    ss << ifs.rdbuf(); out = ss.str();
    return true;
}

static int usage(){
    std::cerr << "usage: tinyc [--tokens | --ast | --target-ast] [--json-diag] [file|-]\n";
    return 1;
}

int main(int argc, char** argv){
    enum class Mode { Compile, Tokens, Ast, TargetAst } mode = Mode::Compile;
    bool jsonDiag = false;
    std::string file;
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a == "--tokens") mode = Mode::Tokens;
        else if(a == "--ast") mode = Mode::Ast;
        else if(a == "--target-ast") mode = Mode::TargetAst;
        else if(a == "--json-diag") jsonDiag = true;
        else if(a == "-h" || a == "--help") return usage();
        else if(a.size() > 1 && a[0] == '-'){ std::cerr << "unknown option: " << a << "\n"; return usage(); }
        else if(file.empty()) file = a;
        else return usage();
    }
    std::string src;
    if(!read_input(file, src)){ std::cerr << "failed to read file: " << file << "\n"; return 1; }

    try{
        switch(mode){
            case Mode::Tokens: std::cout << to_json(scan(src)) << "\n"; break;
            case Mode::Ast: std::cout << to_json(parse(scan(src))) << "\n"; break;
            case Mode::TargetAst: std::cout << to_json(transform(parse(scan(src)))) << "\n"; break;
            case Mode::Compile: std::cout << compile(src) << "\n"; break;
        }
    }catch(const compile_error& e){
        if(jsonDiag){
            compile_result r; r.errors.push_back(to_diagnostic(e));
            std::cerr << diagnostics_to_json(r) << "\n";
        } else {
            std::cerr << "error[" << e.code << "]: " << e.what() << "\n";
            if(!e.hint.empty()) std::cerr << "  hint: " << e.hint << "\n";
        }
        return 2;
    }
    return 0;
}
