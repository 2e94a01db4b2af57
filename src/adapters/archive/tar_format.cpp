#include "tar_format.hpp"

#include <algorithm>
#include <charconv>
#include <cstring>
#include <fmt/core.h>

namespace ferry::adapters::archive {

namespace {

// ustar field offsets and lengths
constexpr std::size_t name_o = 0,       name_l = 100;
constexpr std::size_t mode_o = 100,     mode_l = 8;
constexpr std::size_t uid_o = 108,      uid_l = 8;
constexpr std::size_t gid_o = 116,      gid_l = 8;
constexpr std::size_t size_o = 124,     size_l = 12;
constexpr std::size_t mtime_o = 136,    mtime_l = 12;
constexpr std::size_t chksum_o = 148,   chksum_l = 8;
constexpr std::size_t typeflag_o = 156;
constexpr std::size_t linkname_o = 157, linkname_l = 100;
constexpr std::size_t magic_o = 257;
constexpr std::size_t version_o = 263;
constexpr std::size_t prefix_o = 345,   prefix_l = 155;

constexpr std::uint64_t max_octal_11 = 077777777777ULL;  // size, mtime
constexpr std::uint64_t max_octal_7 = 07777777ULL;       // uid, gid
constexpr std::uint64_t max_extended_size = 16 * 1024 * 1024;

void print_octal(char* field, std::size_t width, std::uint64_t value) {
    // width-1 digits + NUL
    std::string digits = fmt::format("{:0{}o}", value, width - 1);
    std::memcpy(field, digits.data(), width - 1);
    field[width - 1] = '\0';
}

auto header_checksum(const char* block) -> std::uint64_t {
    std::uint64_t sum = 0;
    for (std::size_t i = 0; i < block_size; ++i) {
        if (i >= chksum_o && i < chksum_o + chksum_l) {
            sum += static_cast<unsigned char>(' ');
        } else {
            sum += static_cast<unsigned char>(block[i]);
        }
    }
    return sum;
}

// Some old writers summed signed chars.
auto header_checksum_signed(const char* block) -> std::int64_t {
    std::int64_t sum = 0;
    for (std::size_t i = 0; i < block_size; ++i) {
        if (i >= chksum_o && i < chksum_o + chksum_l) {
            sum += ' ';
        } else {
            sum += static_cast<signed char>(block[i]);
        }
    }
    return sum;
}

void finish_header(char* block) {
    std::memcpy(block + magic_o, "ustar", 6);   // includes NUL
    std::memcpy(block + version_o, "00", 2);
    const auto sum = header_checksum(block);
    std::string digits = fmt::format("{:06o}", sum);
    std::memcpy(block + chksum_o, digits.data(), 6);
    block[chksum_o + 6] = '\0';
    block[chksum_o + 7] = ' ';
}

auto field_string(const char* field, std::size_t width) -> std::string {
    const auto* end = static_cast<const char*>(std::memchr(field, '\0', width));
    return std::string(field, end ? static_cast<std::size_t>(end - field) : width);
}

auto parse_number(const char* field, std::size_t width) -> std::optional<std::uint64_t> {
    const auto first = static_cast<unsigned char>(field[0]);
    if (first & 0x80) {
        // GNU base-256; a negative value (0xff lead) is not accepted here
        if (first == 0xff) return std::nullopt;
        std::uint64_t value = first & 0x7f;
        for (std::size_t i = 1; i < width; ++i) {
            if (value > (UINT64_MAX >> 8)) return std::nullopt;
            value = (value << 8) | static_cast<unsigned char>(field[i]);
        }
        return value;
    }
    std::size_t i = 0;
    while (i < width && field[i] == ' ') ++i;
    std::uint64_t value = 0;
    for (; i < width && field[i] >= '0' && field[i] <= '7'; ++i) {
        value = (value << 3) | static_cast<std::uint64_t>(field[i] - '0');
    }
    return value;
}

auto pax_record(std::string_view key, std::string_view value) -> std::string {
    // "<len> <key>=<value>\n", where len counts its own digits
    const std::size_t body = 1 + key.size() + 1 + value.size() + 1;
    std::size_t len = body + 1;
    while (std::to_string(len).size() + body != len) {
        len = std::to_string(len).size() + body;
    }
    return fmt::format("{} {}={}\n", len, key, value);
}

// Splits name into ustar prefix/name if possible.
auto store_name(char* header, const std::string& name) -> bool {
    const std::size_t len = name.size();
    if (len <= name_l) {
        std::memcpy(header + name_o, name.data(), len);
        return true;
    }
    if (len <= prefix_l + 1 + name_l) {
        for (std::size_t i = len - name_l - 1; i < len && i <= prefix_l; ++i) {
            if (name[i] == '/') {
                std::memcpy(header + name_o, name.data() + i + 1, len - i - 1);
                std::memcpy(header + prefix_o, name.data(), i);
                return true;
            }
        }
    }
    return false;
}

void append_padded(std::vector<char>& out, std::string_view data) {
    out.insert(out.end(), data.begin(), data.end());
    out.resize(out.size() + (padded_size(data.size()) - data.size()), '\0');
}

} // namespace

auto encode_headers(const TarEntry& entry) -> std::vector<char> {
    Block header{};
    std::string records;

    if (!store_name(header.data(), entry.name)) {
        records += pax_record("path", entry.name);
    }
    if (entry.linkname.size() > linkname_l) {
        records += pax_record("linkpath", entry.linkname);
    } else {
        std::memcpy(header.data() + linkname_o, entry.linkname.data(), entry.linkname.size());
    }

    print_octal(header.data() + mode_o, mode_l, entry.mode & 07777);

    if (entry.uid <= max_octal_7) {
        print_octal(header.data() + uid_o, uid_l, entry.uid);
    } else {
        print_octal(header.data() + uid_o, uid_l, 0);
        records += pax_record("uid", std::to_string(entry.uid));
    }
    if (entry.gid <= max_octal_7) {
        print_octal(header.data() + gid_o, gid_l, entry.gid);
    } else {
        print_octal(header.data() + gid_o, gid_l, 0);
        records += pax_record("gid", std::to_string(entry.gid));
    }

    if (entry.size <= max_octal_11) {
        print_octal(header.data() + size_o, size_l, entry.size);
    } else {
        print_octal(header.data() + size_o, size_l, 0);
        records += pax_record("size", std::to_string(entry.size));
    }

    if (entry.mtime >= 0 && static_cast<std::uint64_t>(entry.mtime) <= max_octal_11) {
        print_octal(header.data() + mtime_o, mtime_l, static_cast<std::uint64_t>(entry.mtime));
    } else {
        print_octal(header.data() + mtime_o, mtime_l, 0);
        records += pax_record("mtime", std::to_string(entry.mtime));
    }

    header[typeflag_o] = static_cast<char>(entry.type);
    finish_header(header.data());

    std::vector<char> out;
    if (!records.empty()) {
        Block ext{};
        const auto slash = entry.name.find_last_of('/');
        std::string base = slash == std::string::npos ? entry.name : entry.name.substr(slash + 1);
        std::string ext_name = "PaxHeaders/" + base.substr(0, name_l - 12);
        std::memcpy(ext.data() + name_o, ext_name.data(), std::min(ext_name.size(), name_l));
        print_octal(ext.data() + mode_o, mode_l, 0644);
        print_octal(ext.data() + uid_o, uid_l, 0);
        print_octal(ext.data() + gid_o, gid_l, 0);
        print_octal(ext.data() + size_o, size_l, records.size());
        print_octal(ext.data() + mtime_o, mtime_l,
                    entry.mtime > 0 ? std::min<std::uint64_t>(entry.mtime, max_octal_11) : 0);
        ext[typeflag_o] = 'x';
        finish_header(ext.data());
        out.insert(out.end(), ext.begin(), ext.end());
        append_padded(out, records);
    }
    out.insert(out.end(), header.begin(), header.end());
    return out;
}

auto end_of_archive_blocks() -> std::vector<char> {
    return std::vector<char>(2 * block_size, '\0');
}

auto is_zero_block(const char* block) -> bool {
    return std::all_of(block, block + block_size, [](char c) { return c == '\0'; });
}

auto TarStreamParser::at_entry_boundary() const -> bool {
    return state_ == State::Header && block_fill_ == 0 && !pending_path_ && !pending_linkpath_ &&
           !pending_size_ && !pending_mtime_;
}

auto TarStreamParser::feed(std::string_view data) -> std::expected<void, infra::Error> {
    while (!data.empty()) {
        switch (state_) {
            case State::Header: {
                const std::size_t take = std::min(block_size - block_fill_, data.size());
                std::memcpy(block_.data() + block_fill_, data.data(), take);
                block_fill_ += take;
                data.remove_prefix(take);
                if (block_fill_ == block_size) {
                    block_fill_ = 0;
                    if (auto res = handle_header(); !res) return res;
                }
                break;
            }
            case State::ExtendedData: {
                const auto take = static_cast<std::size_t>(std::min<std::uint64_t>(ext_remaining_, data.size()));
                ext_data_.append(data.data(), take);
                ext_remaining_ -= take;
                data.remove_prefix(take);
                if (ext_remaining_ == 0) {
                    if (auto res = apply_extended(); !res) return res;
                    state_ = padding_remaining_ > 0 ? State::Padding : State::Header;
                }
                break;
            }
            case State::EntryData: {
                const auto take = static_cast<std::size_t>(std::min<std::uint64_t>(data_remaining_, data.size()));
                if (auto res = receiver_.on_data(data.substr(0, take)); !res) return res;
                data_remaining_ -= take;
                data.remove_prefix(take);
                if (data_remaining_ == 0) {
                    ++entries_;
                    if (auto res = receiver_.on_entry_complete(); !res) return res;
                    state_ = padding_remaining_ > 0 ? State::Padding : State::Header;
                }
                break;
            }
            case State::Padding: {
                const auto take = static_cast<std::size_t>(std::min<std::uint64_t>(padding_remaining_, data.size()));
                padding_remaining_ -= take;
                data.remove_prefix(take);
                if (padding_remaining_ == 0) {
                    state_ = State::Header;
                }
                break;
            }
        }
    }
    return {};
}

auto TarStreamParser::handle_header() -> std::expected<void, infra::Error> {
    const char* h = block_.data();
    if (is_zero_block(h)) {
        ++zero_blocks_;
        return {};
    }

    const auto stored = parse_number(h + chksum_o, chksum_l);
    if (!stored || (*stored != header_checksum(h) &&
                    static_cast<std::int64_t>(*stored) != header_checksum_signed(h))) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ArchiveIOFailure,
            "tar header checksum mismatch"));
    }

    const char typeflag = h[typeflag_o];
    auto size = parse_number(h + size_o, size_l);
    if (!size) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ArchiveIOFailure,
            "invalid size field in tar header"));
    }

    if (typeflag == 'x' || typeflag == 'g' || typeflag == 'L' || typeflag == 'K') {
        if (*size > max_extended_size) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ArchiveIOFailure,
                fmt::format("extended header too large ({} bytes)", *size)));
        }
        ext_type_ = typeflag;
        ext_data_.clear();
        ext_remaining_ = *size;
        padding_remaining_ = padded_size(*size) - *size;
        if (ext_remaining_ == 0) {
            if (auto res = apply_extended(); !res) return res;
            state_ = State::Header;
        } else {
            state_ = State::ExtendedData;
        }
        return {};
    }

    TarEntry entry;
    if (pending_path_) {
        entry.name = *pending_path_;
    } else {
        const auto prefix = field_string(h + prefix_o, prefix_l);
        const auto name = field_string(h + name_o, name_l);
        entry.name = prefix.empty() ? name : prefix + "/" + name;
    }
    entry.linkname = pending_linkpath_ ? *pending_linkpath_ : field_string(h + linkname_o, linkname_l);
    entry.size = pending_size_ ? *pending_size_ : *size;
    entry.mode = static_cast<std::uint32_t>(parse_number(h + mode_o, mode_l).value_or(0644) & 07777);
    entry.uid = parse_number(h + uid_o, uid_l).value_or(0);
    entry.gid = parse_number(h + gid_o, gid_l).value_or(0);
    entry.mtime = pending_mtime_ ? *pending_mtime_
                                 : static_cast<std::int64_t>(parse_number(h + mtime_o, mtime_l).value_or(0));

    switch (typeflag) {
        case '\0':
        case '0':
        case '7': entry.type = EntryType::Regular; break;
        case '1': entry.type = EntryType::HardLink; break;
        case '2': entry.type = EntryType::Symlink; break;
        case '3': entry.type = EntryType::CharDev; break;
        case '4': entry.type = EntryType::BlockDev; break;
        case '5': entry.type = EntryType::Directory; break;
        case '6': entry.type = EntryType::Fifo; break;
        default:  entry.type = EntryType::Other; break;
    }

    pending_path_.reset();
    pending_linkpath_.reset();
    pending_size_.reset();
    pending_mtime_.reset();

    const bool has_data = entry.type == EntryType::Regular || entry.type == EntryType::Other;
    const std::uint64_t data_size = has_data ? entry.size : 0;

    if (auto res = receiver_.on_entry(entry); !res) return res;

    if (data_size == 0) {
        ++entries_;
        if (auto res = receiver_.on_entry_complete(); !res) return res;
        state_ = State::Header;
        return {};
    }
    data_remaining_ = data_size;
    padding_remaining_ = padded_size(data_size) - data_size;
    state_ = State::EntryData;
    return {};
}

auto TarStreamParser::apply_extended() -> std::expected<void, infra::Error> {
    if (ext_type_ == 'L' || ext_type_ == 'K') {
        auto value = ext_data_.substr(0, ext_data_.find('\0'));
        (ext_type_ == 'L' ? pending_path_ : pending_linkpath_) = std::move(value);
        return {};
    }
    if (ext_type_ == 'g') {
        return {}; // global records are not used
    }

    std::string_view rest = ext_data_;
    while (!rest.empty()) {
        const auto space = rest.find(' ');
        std::size_t len = 0;
        if (space == std::string_view::npos ||
            std::from_chars(rest.data(), rest.data() + space, len).ec != std::errc{} ||
            len <= space + 1 || len > rest.size() || rest[len - 1] != '\n') {
            return std::unexpected(infra::make_error(infra::ErrorCode::ArchiveIOFailure,
                "malformed pax extended header record"));
        }
        const auto record = rest.substr(space + 1, len - space - 2);
        rest.remove_prefix(len);

        const auto eq = record.find('=');
        if (eq == std::string_view::npos) continue;
        const auto key = record.substr(0, eq);
        const auto value = record.substr(eq + 1);

        if (key == "path") {
            pending_path_ = std::string(value);
        } else if (key == "linkpath") {
            pending_linkpath_ = std::string(value);
        } else if (key == "size") {
            std::uint64_t v = 0;
            if (std::from_chars(value.data(), value.data() + value.size(), v).ec == std::errc{}) {
                pending_size_ = v;
            }
        } else if (key == "mtime") {
            // may carry a fractional part; seconds are enough here
            std::int64_t v = 0;
            if (std::from_chars(value.data(), value.data() + value.size(), v).ec == std::errc{}) {
                pending_mtime_ = v;
            }
        }
    }
    return {};
}

} // namespace ferry::adapters::archive
