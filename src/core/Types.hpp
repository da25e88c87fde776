// ========================= src/core/Types.hpp =========================
#pragma once
#include <cstdint>
#include <vector>
#include <string>
#include <optional>
#include <array>

namespace pupu {

    constexpr int kWidth = 12;
    constexpr int kHeight = 12;

    // Order matters: erasable kinds first (0..7), then glass, then the immobile ones.
    enum class Tile : uint8_t {
        Heart = 0,
        Diamond,
        Triangle,
        Ring,
        Cross1,
        Sandglass,
        Cross2,
        Frame,
        Glass,      // falls and can be moved, never matches
        Wall,
        Background,
        Empty
    };

    constexpr int kErasableKinds = 8;

    constexpr bool isMobile(Tile t) { return t <= Tile::Glass; }
    constexpr bool isErasable(Tile t) { return t <= Tile::Frame; }
    constexpr int kindIndex(Tile t) { return static_cast<int>(t); }

    struct Move {
        int y{ 0 };
        int fromX{ 0 };
        int toX{ 0 };

        bool operator==(const Move& o) const { return y == o.y && fromX == o.fromX && toX == o.toX; }
        bool operator!=(const Move& o) const { return !(*this == o); }
    };

    enum class ErrorKind : uint8_t {
        None = 0,
        InvalidLevelDimensions,
        UnknownTileSymbol,
        IllegalMove,
        FileUnreadable,
        BadOption
    };

    inline const char* errorName(ErrorKind k) {
        switch (k) {
        case ErrorKind::None: return "None";
        case ErrorKind::InvalidLevelDimensions: return "InvalidLevelDimensions";
        case ErrorKind::UnknownTileSymbol: return "UnknownTileSymbol";
        case ErrorKind::IllegalMove: return "IllegalMove";
        case ErrorKind::FileUnreadable: return "FileUnreadable";
        case ErrorKind::BadOption: return "BadOption";
        }
        return "Unknown";
    }

    struct SymbolEntry { char symbol; Tile tile; };

    // Level text alphabet, one entry per tile kind in enum order.
    constexpr std::array<SymbolEntry, 12> kSymbols{ {
        { 'H', Tile::Heart },
        { 'D', Tile::Diamond },
        { 'T', Tile::Triangle },
        { 'R', Tile::Ring },
        { '1', Tile::Cross1 },
        { 'S', Tile::Sandglass },
        { '2', Tile::Cross2 },
        { 'F', Tile::Frame },
        { 'G', Tile::Glass },
        { '#', Tile::Wall },
        { 'P', Tile::Background },
        { '.', Tile::Empty },
    } };

    constexpr char symbolFor(Tile t) { return kSymbols[static_cast<size_t>(t)].symbol; }

    inline std::optional<Tile> tileForSymbol(char c) {
        for (const auto& e : kSymbols) if (e.symbol == c) return e.tile;
        return std::nullopt;
    }

    inline const char* tileName(Tile t) {
        switch (t) {
        case Tile::Heart: return "Heart";
        case Tile::Diamond: return "Diamond";
        case Tile::Triangle: return "Triangle";
        case Tile::Ring: return "Ring";
        case Tile::Cross1: return "Cross #1";
        case Tile::Sandglass: return "Sandglass";
        case Tile::Cross2: return "Cross #2";
        case Tile::Frame: return "Frame";
        case Tile::Glass: return "Glass block";
        case Tile::Wall: return "Wall";
        case Tile::Background: return "Background/Pattern";
        case Tile::Empty: return "Empty";
        }
        return "?";
    }

} // namespace pupu
