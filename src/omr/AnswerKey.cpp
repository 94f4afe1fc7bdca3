#include "omr/AnswerKey.hpp"
#include "omr/Errors.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>

namespace omr {

namespace {

std::string trim(const std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) b--;
    return s.substr(a, b - a);
}

std::vector<std::string> splitCSV(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string tok;
    while (std::getline(ss, tok, ',')) {
        tok = trim(tok);
        if (!tok.empty()) out.push_back(tok);
    }
    return out;
}

}

AnswerKey::AnswerKey(const std::map<int, char>& answers) {
    for (const auto& [q, a] : answers) set(q, a);
}

void AnswerKey::set(int questionNumber, char correctAnswer) {
    if (questionNumber < 1) {
        throw ConfigError("answer key question numbers start at 1, got " + std::to_string(questionNumber));
    }
    char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(correctAnswer)));
    if (upper < 'A' || upper > 'Z') {
        throw ConfigError("answer key entry for question " + std::to_string(questionNumber)
                          + " is not an option letter");
    }
    keyMap_[questionNumber] = upper;
}

void AnswerKey::loadAnswerKey(const std::vector<QuestionAnswer>& answers) {
    AnswerKey loaded;
    for (const auto& k : answers) loaded.set(k.questionNumber, k.correctAnswer);
    keyMap_.swap(loaded.keyMap_);
}

AnswerKey AnswerKey::fromString(const std::string& letters) {
    AnswerKey key;
    int q = 1;
    for (char c : letters) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        key.set(q++, c);
    }
    return key;
}

AnswerKey AnswerKey::parse(const std::string& text) {
    AnswerKey key;
    for (const auto& tok : splitCSV(text)) {
        size_t colon = tok.find(':');
        if (colon == std::string::npos) {
            throw ConfigError("answer key entry '" + tok + "' is not of the form <question>:<letter>");
        }
        std::string num = trim(tok.substr(0, colon));
        std::string letter = trim(tok.substr(colon + 1));
        if (letter.size() != 1) {
            throw ConfigError("answer key entry '" + tok + "' must name a single letter");
        }

        int q = 0;
        try {
            size_t used = 0;
            q = std::stoi(num, &used);
            if (used != num.size()) throw std::invalid_argument(num);
        } catch (const std::logic_error&) {
            throw ConfigError("answer key entry '" + tok + "' has a bad question number");
        }
        key.set(q, letter[0]);
    }
    return key;
}

bool AnswerKey::contains(int questionNumber) const {
    return keyMap_.find(questionNumber) != keyMap_.end();
}

char AnswerKey::getCorrectAnswer(int questionNumber) const {
    auto it = keyMap_.find(questionNumber);
    return it == keyMap_.end() ? '\0' : it->second;
}

}
