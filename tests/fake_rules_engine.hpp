#pragma once

#include "rules/rules_engine.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace chessan::test {

// Board stand-in whose moves are scripted as (fen, move) -> next fen.
class FakeRulesEngine : public rules::RulesEngine {
public:
    explicit FakeRulesEngine(std::string fen) : m_fen(std::move(fen)) {}

    void add_transition(const std::string& from, const std::string& move, const std::string& to) {
        m_transitions[{from, move}] = to;
    }

    std::vector<std::string> legal_moves() const override {
        std::vector<std::string> moves;
        for (const auto& [key, next] : m_transitions) {
            if (key.first == m_fen) {
                moves.push_back(key.second);
            }
        }
        return moves;
    }

    bool apply_move(std::string_view uci_move) override {
        auto it = m_transitions.find({m_fen, std::string(uci_move)});
        if (it == m_transitions.end()) {
            return false;
        }
        m_fen = it->second;
        return true;
    }

    void set_fen(std::string_view fen) override {
        if (fen.empty()) {
            throw rules::FenError("empty FEN");
        }
        m_fen = std::string(fen);
    }

    std::string fen() const override { return m_fen; }

    rules::Side turn() const override {
        auto space = m_fen.find(' ');
        return space != std::string::npos && m_fen.compare(space + 1, 1, "b") == 0
                   ? rules::Side::Black
                   : rules::Side::White;
    }

private:
    std::string m_fen;
    std::map<std::pair<std::string, std::string>, std::string> m_transitions;
};

} // namespace chessan::test
