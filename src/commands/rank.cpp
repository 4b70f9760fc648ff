#include "commands/rank.hpp"

#include "docintel/Pipeline.hpp"
#include "docintel/RankingArtifact.hpp"
#include "io/JsonIO.hpp"

#include "emb/HashEmbedder.hpp"
#include "emb/MiniLmEmbedder.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int get_arg_int(int argc, char** argv, const std::string& key, int def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        throw std::invalid_argument("bad integer for " + key + ": " + s);
    }
}

static double get_arg_double(int argc, char** argv, const std::string& key, double def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try {
        return std::stod(s);
    } catch (const std::exception&) {
        throw std::invalid_argument("bad number for " + key + ": " + s);
    }
}

static std::vector<docintel::DocumentInput> load_documents(const CollectionInput& ci, const fs::path& blocks_dir) {
    std::vector<docintel::DocumentInput> docs;
    docs.reserve(ci.documents.size());

    for (const auto& d : ci.documents) {
        docintel::DocumentInput in;
        in.doc_id = d.filename;

        const fs::path p = blocks_dir / (fs::path(d.filename).stem().string() + ".json");
        try {
            in.blocks = loadTextBlocks(p.string());
        } catch (const std::runtime_error& e) {
            in.load_error = e.what();
            std::cerr << "warning: " << d.filename << ": " << e.what() << "\n";
        }
        docs.push_back(std::move(in));
    }
    return docs;
}

int cmd_rank(int argc, char** argv) {
    try {
        const std::string input_arg = get_arg(argc, argv, "--input", "");
        if (input_arg.empty()) throw std::runtime_error("missing --input <collection json>");

        const fs::path input_path = input_arg;
        const fs::path blocks_dir = get_arg(argc, argv, "--blocks", (input_path.parent_path() / "blocks").string());
        const fs::path out_path = get_arg(argc, argv, "--out", "out/ranking.json");

        const bool hash_embed = has_flag(argc, argv, "--hash_embed");
        const std::string emb_model = get_arg(argc, argv, "--emb_model", "");
        const std::string emb_vocab = get_arg(argc, argv, "--emb_vocab", "");

        docintel::PipelineConfig cfg;
        cfg.ranker.k = get_arg_int(argc, argv, "--topk", cfg.ranker.k);
        cfg.ranker.lambda = get_arg_double(argc, argv, "--lambda", cfg.ranker.lambda);
        cfg.ranker.min_relevance = get_arg_double(argc, argv, "--min_relevance", cfg.ranker.min_relevance);
        cfg.score.w_semantic = get_arg_double(argc, argv, "--w_sem", cfg.score.w_semantic);
        cfg.score.w_lexical = get_arg_double(argc, argv, "--w_lex", cfg.score.w_lexical);
        cfg.score.w_structural = get_arg_double(argc, argv, "--w_struct", cfg.score.w_structural);
        cfg.score.role_weight = get_arg_double(argc, argv, "--role_weight", cfg.score.role_weight);
        cfg.score.task_weight = get_arg_double(argc, argv, "--task_weight", cfg.score.task_weight);
        cfg.budget_ms = get_arg_int(argc, argv, "--budget_ms", 0);

        const int threads = get_arg_int(argc, argv, "--threads", 0);
        if (threads < 0) throw std::invalid_argument("--threads must be >= 0");
        cfg.threads = (unsigned)threads;

        if (cfg.ranker.k < 0) throw std::invalid_argument("--topk must be >= 0");
        if (cfg.ranker.lambda < 0.0) throw std::invalid_argument("--lambda must be >= 0");

        const CollectionInput ci = loadCollectionInput(input_path.string());
        const auto docs = load_documents(ci, blocks_dir);

        // loaded once, shared read-only by every worker
        std::unique_ptr<docintel::Embedder> embedder;
        if (hash_embed) {
            embedder = std::make_unique<HashEmbedder>();
        } else if (!emb_model.empty() || !emb_vocab.empty()) {
            if (emb_model.empty() || emb_vocab.empty()) {
                throw std::runtime_error("semantic scoring needs both --emb_model and --emb_vocab");
            }
            auto mini = std::make_unique<MiniLmEmbedder>();
            if (!mini->init(emb_model, emb_vocab)) {
                std::cerr << "warning: MiniLmEmbedder init failed; ranking lexical-only\n";
            }
            embedder = std::move(mini);
        }

        const docintel::CollectionResult res =
            docintel::process_collection(docs, ci.persona, ci.job, embedder.get(), cfg);

        docintel::RankingArtifact artifact;
        for (const auto& d : ci.documents) artifact.input_documents.push_back(d.filename);
        artifact.persona = ci.persona;
        artifact.job = ci.job;
        artifact.persona_type = res.profile.persona_type;
        artifact.requirements = res.profile.requirements;
        artifact.processing_timestamp = docintel::iso_timestamp_now();
        artifact.score_cfg = docintel::normalized(cfg.score);
        artifact.ranker_cfg = cfg.ranker;
        artifact.semantic_enabled = res.semantic_enabled;
        artifact.ranked = res.ranked;
        artifact.refined = res.refined;
        artifact.reports = res.reports;

        artifact.write_to(out_path);

        for (const auto& r : res.reports) {
            if (r.status == docintel::DocStatus::Ok) continue;
            std::cerr << "warning: " << r.doc_id << ": " << docintel::status_name(r.status);
            if (!r.message.empty()) std::cerr << " (" << r.message << ")";
            std::cerr << "\n";
        }

        std::cout << "PERSONA: " << ci.persona << "\n";
        std::cout << "PERSONA_TYPE: " << res.profile.persona_type << "\n";
        std::cout << "DOCUMENTS: " << docs.size() << "\n";
        std::cout << "CANDIDATES: " << res.candidates << "\n";
        std::cout << "FLOOR: " << res.ranked.floor << "\n";
        std::cout << "SECTIONS: " << res.ranked.entries.size() << "\n";
        std::cout << "SEMANTIC: " << (embedder ? embedder->name() : std::string("off")) << "\n";
        std::cout << "OUT_RANKING: " << out_path.string() << "\n";

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "rank failed: " << e.what() << "\n";
        return 1;
    }
}
