#include <iostream>
#include <map>
#include <string>

#include "assay/assay.hpp"

namespace {

    using Form = std::map<std::string, std::string>;

    struct Server {
        std::string host;
        int port = 0;
        std::string url;
    };

    Assay::Decode<Form, std::string> field(const std::string& key) {
        return Assay::Decode<Form, std::string>{ [key](const Form& form) -> Assay::Validation<std::string> {
            auto it = form.find(key);
            if (it == form.end())
                return Assay::failure_with_message<std::string>({}, "is required", { { "", "Server" }, { key, "string" } });
            return Assay::success(it->second);
        }};
    }

    Assay::Validate<std::string, int> port_number() {
        return Assay::from_result<std::string>([](const std::string& s) { return std::stoi(s); }, "not a number")
             | Assay::chain([](const int& n) {
                   return n > 0 && n <= 65535 ? Assay::succeed<std::string>(n)
                                              : Assay::fail<std::string, int>("out of range");
               });
    }

    Assay::Decode<Form, int> port_field() {
        return field("port") | Assay::chain([](const std::string& text) {
            return Assay::Decode<Form, int>{ [text](const Form&) {
                return Assay::run(port_number(), text, { { "", "Server" }, { "port", "int" } });
            }};
        });
    }

    void report(const Assay::Validation<Server>& r) {
        if (!r) {
            std::cout << Assay::ValidationErrors{ r.error() }.what() << '\n';
            std::cout << Assay::to_string(r.error(), { .numbered = true }) << "\n\n";
            return;
        }
        std::cout << "ok: " << r->url << "\n\n";
    }

} // namespace

int main() {
    auto default_port = Assay::alt_monoid([] { return port_field(); });

    auto server = Assay::do_<Form>(Server{})
                | Assay::ap_s_l(Assay::lens_of(&Server::host), field("host"))
                | Assay::ap_s_l(Assay::lens_of(&Server::port), default_port.concat(port_field(), Assay::of<Form>(8080)))
                | Assay::let(
                      [](Server s, const std::string& url) { s.url = url; return s; },
                      [](const Server& s) { return "http://" + s.host + ":" + std::to_string(s.port); });

    report(server(Form{ { "host", "example.org" }, { "port", "443" } }));
    report(server(Form{ { "host", "example.org" } }));
    report(server(Form{ { "port", "http" } }));

    auto strict = Assay::do_<Form>(Server{})
                | Assay::ap_s_l(Assay::lens_of(&Server::host), field("host"))
                | Assay::ap_s_l(Assay::lens_of(&Server::port), port_field());

    report(strict(Form{ { "port", "99999" } }));

    try {
        Server s = Assay::value_or_throw(strict(Form{}));
        std::cout << s.host << '\n';
    } catch (const Assay::ValidationErrors& e) {
        std::cout << "caught " << e.what() << '\n' << e.errors() << '\n';
    }

    return 0;
}
