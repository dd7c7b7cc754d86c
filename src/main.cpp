// Décodeur de replays - export JSON
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>

#include "replay_decoder.hpp"
#include "replay_json.hpp"

using namespace replay;

namespace {

void printUsage(const char *program) {
    std::printf("Usage: %s [options] <replay>\n", program);
    std::printf("  -q, --quiet           - Aucun message sur stderr\n");
    std::printf("  --pretty              - JSON indenté\n");
    std::printf("  --commands N          - Limite les commandes exportées (0 = toutes)\n");
    std::printf("  --rule null|prefix|fixed\n");
    std::printf("                        - Règle de longueur des messages de chat\n");
    std::printf("  -o <fichier>          - Fichier de sortie (défaut: stdout)\n");
}

bool parseRule(const char *text, VariableLengthRule &rule) {
    if (std::strcmp(text, "null") == 0) {
        rule = VariableLengthRule::NullTerminated;
    } else if (std::strcmp(text, "prefix") == 0) {
        rule = VariableLengthRule::LengthPrefixed;
    } else if (std::strcmp(text, "fixed") == 0) {
        rule = VariableLengthRule::FixedCap;
    } else {
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char **argv) {
    DecoderOptions opt;
    bool pretty = false;
    std::string inputPath;
    std::string outputPath;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-q") == 0 || std::strcmp(argv[i], "--quiet") == 0) {
            opt.quiet = true;
        } else if (std::strcmp(argv[i], "--pretty") == 0) {
            pretty = true;
        } else if (std::strcmp(argv[i], "--commands") == 0 && i + 1 < argc) {
            char *end = nullptr;
            const unsigned long long n = std::strtoull(argv[++i], &end, 10);
            if (end == argv[i] || *end != '\0') {
                std::fprintf(stderr, "❌ Nombre de commandes invalide: %s\n", argv[i]);
                return 1;
            }
            opt.sample_commands = static_cast<size_t>(n);
        } else if (std::strcmp(argv[i], "--rule") == 0 && i + 1 < argc) {
            if (!parseRule(argv[++i], opt.variable_length_rule)) {
                std::fprintf(stderr, "❌ Règle inconnue: %s\n", argv[i]);
                return 1;
            }
        } else if (std::strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
            outputPath = argv[++i];
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (argv[i][0] == '-') {
            std::fprintf(stderr, "❌ Option inconnue: %s\n", argv[i]);
            printUsage(argv[0]);
            return 1;
        } else if (inputPath.empty()) {
            inputPath = argv[i];
        } else {
            std::fprintf(stderr, "❌ Un seul fichier replay attendu\n");
            return 1;
        }
    }

    if (inputPath.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        const DecodeResult result = decode_replay_file(inputPath, opt);
        const nlohmann::json doc = export_document(result, opt);
        const std::string text = doc.dump(pretty ? 2 : -1);

        if (outputPath.empty()) {
            std::cout << text << '\n';
        } else {
            std::ofstream out(outputPath, std::ios::binary);
            if (!out) {
                log_error("main", "impossible de créer " + outputPath, opt);
                return 2;
            }
            out << text << '\n';
            if (!out) {
                log_error("main", "écriture incomplète de " + outputPath, opt);
                return 2;
            }
            log_info("main", "✅ " + outputPath + " écrit", opt);
        }
    } catch (const InvalidFormatError &e) {
        log_error("main", std::string("format invalide: ") + e.what(), opt);
        return 3;
    } catch (const std::exception &e) {
        log_error("main", e.what(), opt);
        return 2;
    }
    return 0;
}
