#include <cmath>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cmdq/cmdq.hpp"
#include "cmdq/parse.hpp"

// User types reach handlers either through a Converter (text in, typed value
// out) or through a factory registered with the Registry.

struct Point {
    double x{0};
    double y{0};
};

struct Rgb {
    int r{0};
    int g{0};
    int b{0};
};

// Accepts "x,y" as one token or "x y" as two.
class PointConverter final : public cmdq::Converter {
public:
    cmdq::Type type() const override { return cmdq::Type::object<Point>("point"); }
    std::string name() const override { return "point converter"; }

    std::optional<cmdq::Value> convertFromScalar(std::string_view token, const cmdq::Context& ctx) const override {
        const auto comma = token.find(',');
        if (comma == std::string_view::npos) return std::nullopt;
        return convertFromArray({std::string(token.substr(0, comma)), std::string(token.substr(comma + 1))}, ctx);
    }

    std::optional<cmdq::Value> convertFromArray(const std::vector<std::string>& tokens,
                                                const cmdq::Context&) const override {
        if (tokens.size() != 2) return std::nullopt;
        const auto x = cmdq::parse::toDouble(tokens[0]);
        const auto y = cmdq::parse::toDouble(tokens[1]);
        if (!x || !y) return std::nullopt;
        return cmdq::Value::object(Point{*x, *y}, type());
    }
};

struct Geometry {
    double distance(const cmdq::Context&, Point a, Point b) { return std::hypot(b.x - a.x, b.y - a.y); }

    std::string paint(const cmdq::Context&, Rgb color) {
        return "painting rgb(" + std::to_string(color.r) + ", " + std::to_string(color.g) + ", " +
               std::to_string(color.b) + ")";
    }
};

int main() {
    auto registry = std::make_shared<cmdq::Registry>();
    registry->addConverter(std::make_shared<PointConverter>());
    registry->addType<Rgb>([](const std::vector<cmdq::Value>& tokens, const cmdq::Context&) -> std::optional<cmdq::Value> {
        if (tokens.size() != 3) return std::nullopt;
        Rgb color;
        int* channels[] = {&color.r, &color.g, &color.b};
        for (std::size_t i = 0; i < 3; ++i) {
            const auto v = cmdq::parse::toInt(tokens[i].toString());
            if (!v || *v < 0 || *v > 255) return std::nullopt;
            *channels[i] = *v;
        }
        return cmdq::Value::of(color);
    });

    cmdq::CommandQueue queue(registry);
    queue.registerMetadata(
        cmdq::CommandMetadata(cmdq::Alias("distance|dist"), cmdq::ExecutorData::bind(&Geometry::distance)));
    queue.registerMetadata(
        cmdq::CommandMetadata(cmdq::Alias("paint"), cmdq::ExecutorData::bind(&Geometry::paint, {3})));
    queue.start();

    const std::vector<std::string> lines = {
        "distance 0,0 3,4",
        "dist 1,1",
        "paint 255 128 0",
        "paint 300 0 0",
        "distance here there",
    };

    for (const auto& line : lines) {
        auto result = std::make_shared<std::promise<std::string>>();
        auto text = result->get_future();
        queue.submit(line, cmdq::Context(), [result](cmdq::Outcome outcome, const cmdq::Output& output) {
            if (outcome == cmdq::Outcome::Success) {
                result->set_value(output.value().toString());
            } else if (outcome == cmdq::Outcome::Failure) {
                result->set_value(std::string("failed: ") + output.errorMessage());
            } else {
                result->set_value("unhandled");
            }
        });
        std::cout << line << " -> " << text.get() << "\n";
    }

    queue.stop();
    return 0;
}
