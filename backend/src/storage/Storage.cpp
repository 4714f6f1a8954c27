#include "Storage.hpp"
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <sodium.h>
#include <spdlog/spdlog.h>

static const char MAGIC_HDR[] = "SRSREV1\n";

// Ids are opaque, so a raw id could hold a line break or be the "---" terminator.
// Backslash, CR and LF are escaped, and a leading '-' is escaped so no field line
// can ever read as "---".
static std::string escapeField(const std::string& raw) {
    std::string out;
    out.reserve(raw.size() + 2);
    for (std::size_t i = 0; i < raw.size(); ++i) {
        char c = raw[i];
        if (c == '\\') out += "\\\\";
        else if (c == '\n') out += "\\n";
        else if (c == '\r') out += "\\r";
        else if (c == '-' && i == 0) out += "\\-";
        else out += c;
    }
    return out;
}

static bool unescapeField(const std::string& field, std::string& out) {
    out.clear();
    for (std::size_t i = 0; i < field.size(); ++i) {
        char c = field[i];
        if (c != '\\') {
            out += c;
            continue;
        }
        if (++i == field.size()) return false;
        switch (field[i]) {
        case '\\': out += '\\'; break;
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case '-': out += '-'; break;
        default: return false;
        }
    }
    return true;
}

/*
  Plain block per record:
    item_id           (escaped, see escapeField)
    owner_id          (escaped)
    due_at            (unix seconds)
    ease_factor       (max_digits10, lossless)
    interval_days
    repetition_count
    last_grade        (again|hard|good|easy)
    last_reviewed_at  (unix seconds, or "-")
    ---
*/
std::string Storage::serializeReviews(const std::vector<ReviewRecord>& records) {
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10);

    for (const auto& r : records) {
        oss << escapeField(r.item_id) << "\n"
            << escapeField(r.owner_id) << "\n"
            << static_cast<long long>(r.due_at) << "\n"
            << r.ease_factor << "\n"
            << r.interval_days << "\n"
            << r.repetition_count << "\n"
            << gradeName(r.last_grade) << "\n";

        if (r.last_reviewed_at)
            oss << static_cast<long long>(*r.last_reviewed_at) << "\n";
        else
            oss << "-\n";

        oss << "---\n";
    }

    return oss.str();
}

static bool parseTimestamp(const std::string& s, std::time_t& out) {
    try {
        std::size_t used = 0;
        long long v = std::stoll(s, &used);
        if (used != s.size()) return false;
        out = static_cast<std::time_t>(v);
        return true;
    }
    catch (const std::logic_error&) {
        return false;
    }
}

static bool parseBlock(const std::vector<std::string>& lines, ReviewRecord& r) {
    if (lines.size() != 8) return false;

    if (!unescapeField(lines[0], r.item_id) || !unescapeField(lines[1], r.owner_id)) return false;
    if (r.item_id.empty()) return false;

    if (!parseTimestamp(lines[2], r.due_at)) return false;

    try {
        r.ease_factor = std::stod(lines[3]);
        r.interval_days = std::stoi(lines[4]);
        r.repetition_count = std::stoi(lines[5]);
    }
    catch (const std::logic_error&) {
        return false;
    }

    auto grade = gradeFromName(lines[6]);
    if (!grade) return false;
    r.last_grade = *grade;

    // a bad review timestamp is kept as "unknown" so it never wins a conflict
    std::time_t reviewed = 0;
    if (parseTimestamp(lines[7], reviewed))
        r.last_reviewed_at = reviewed;
    else
        r.last_reviewed_at.reset();

    return true;
}

std::size_t Storage::parseReviews(const std::string& plain, std::vector<ReviewRecord>& records) {
    std::istringstream iss(plain);
    records.clear();

    std::size_t skipped = 0;
    std::vector<std::string> block;
    std::string line;

    while (std::getline(iss, line)) {
        if (line != "---") {
            block.push_back(line);
            continue;
        }

        ReviewRecord r;
        if (parseBlock(block, r)) {
            records.push_back(std::move(r));
        }
        else {
            ++skipped;
            spdlog::warn("Skipping malformed review block ({} lines)", block.size());
        }
        block.clear();
    }

    if (!block.empty()) {
        ++skipped;
        spdlog::warn("Skipping unterminated review block at end of data");
    }

    return skipped;
}

bool Storage::saveReviews(const std::vector<ReviewRecord>& records, const std::string& filename,
    const std::vector<unsigned char>& key, const std::vector<unsigned char>& salt) {
    spdlog::info("Saving {} encrypted reviews to '{}'", records.size(), filename);
    if (key.size() != crypto_secretbox_KEYBYTES) {
        spdlog::error("Invalid key size");
        return false;
    }
    if (salt.size() != crypto_pwhash_SALTBYTES) {
        spdlog::error("Invalid salt size");
        return false;
    }

    std::string plain = serializeReviews(records);
    const unsigned char* p = reinterpret_cast<const unsigned char*>(plain.data());
    unsigned long long plen = plain.size();

    std::vector<unsigned char> ciphertext(plen + crypto_secretbox_MACBYTES);

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    randombytes_buf(nonce, sizeof(nonce));

    if (crypto_secretbox_easy(ciphertext.data(), p, plen, nonce, key.data()) != 0) {
        spdlog::error("Encryption failed");
        return false;
    }

    // write beside the target, then swap in, so a crash never leaves half a file
    const std::string tmp = filename + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            spdlog::error("Failed to open '{}' for encrypted write", tmp);
            return false;
        }

        out.write(MAGIC_HDR, sizeof(MAGIC_HDR) - 1);
        out.write(reinterpret_cast<const char*>(salt.data()), salt.size());
        out.write(reinterpret_cast<const char*>(nonce), sizeof(nonce));
        out.write(reinterpret_cast<const char*>(ciphertext.data()), ciphertext.size());
        if (!out) {
            spdlog::error("Short write to '{}'", tmp);
            return false;
        }
    }

    if (std::rename(tmp.c_str(), filename.c_str()) != 0) {
        spdlog::error("Failed to move '{}' over '{}'", tmp, filename);
        std::remove(tmp.c_str());
        return false;
    }
    return true;
}

static bool readHeader(std::ifstream& in, std::vector<unsigned char>& salt) {
    char hdr[sizeof(MAGIC_HDR) - 1];
    in.read(hdr, sizeof(hdr));
    if (in.gcount() != sizeof(hdr) || std::strncmp(hdr, MAGIC_HDR, sizeof(hdr)) != 0) {
        spdlog::error("Invalid magic header");
        return false;
    }

    salt.assign(crypto_pwhash_SALTBYTES, 0);
    in.read(reinterpret_cast<char*>(salt.data()), salt.size());
    if (in.gcount() != static_cast<std::streamsize>(salt.size())) {
        spdlog::error("Failed to read salt");
        return false;
    }
    return true;
}

bool Storage::loadReviews(std::vector<ReviewRecord>& records, const std::string& filename,
    const std::vector<unsigned char>& key) {
    spdlog::info("Loading encrypted reviews from '{}'", filename);
    records.clear();

    if (key.size() != crypto_secretbox_KEYBYTES) {
        spdlog::error("Invalid key size");
        return false;
    }

    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        spdlog::warn("Review file '{}' not found; treating as empty", filename);
        return true;
    }

    std::vector<unsigned char> salt;
    if (!readHeader(in, salt)) return false;

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    in.read(reinterpret_cast<char*>(nonce), sizeof(nonce));
    if (in.gcount() != sizeof(nonce)) {
        spdlog::error("Failed to read nonce");
        return false;
    }

    std::vector<unsigned char> ciphertext(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>());

    if (ciphertext.size() < crypto_secretbox_MACBYTES) {
        spdlog::error("Ciphertext too short");
        return false;
    }

    std::vector<unsigned char> plain(ciphertext.size() - crypto_secretbox_MACBYTES);
    if (crypto_secretbox_open_easy(plain.data(), ciphertext.data(), ciphertext.size(), nonce, key.data()) != 0) {
        spdlog::error("Decryption failed (wrong passphrase or corrupted file)");
        return false;
    }

    std::string plain_str(reinterpret_cast<char*>(plain.data()), plain.size());
    std::size_t skipped = parseReviews(plain_str, records);

    spdlog::info("Loaded {} reviews ({} skipped)", records.size(), skipped);
    return true;
}

bool Storage::readSalt(const std::string& filename, std::vector<unsigned char>& salt) {
    std::ifstream in(filename, std::ios::binary);
    if (!in) return false;
    return readHeader(in, salt);
}

std::vector<unsigned char> Storage::randomSalt() {
    std::vector<unsigned char> salt(crypto_pwhash_SALTBYTES);
    randombytes_buf(salt.data(), salt.size());
    return salt;
}

std::vector<unsigned char> Storage::deriveKey(const std::string& passphrase, const std::vector<unsigned char>& salt) {
    spdlog::debug("Deriving storage key (not logging passphrase or salt)");

    if (salt.size() != crypto_pwhash_SALTBYTES)
        throw std::invalid_argument("key derivation salt has the wrong size");

    std::vector<unsigned char> key(crypto_secretbox_KEYBYTES, 0);

    if (crypto_pwhash(key.data(),
        key.size(),
        passphrase.c_str(),
        static_cast<unsigned long long>(passphrase.size()),
        salt.data(),
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE,
        crypto_pwhash_ALG_DEFAULT) != 0)
    {
        spdlog::error("crypto_pwhash failed during storage key derivation");
        throw std::runtime_error("crypto_pwhash failed (out of memory)");
    }

    spdlog::debug("Storage key derived successfully");
    return key;
}
