// Blog Example
// One controller behind an Endpoint: auto-rendered index, manual render,
// redirect with a flash message carried through the session cookie, and
// format negotiation refusing xml.

#include "conduit/conduit.hpp"

#include <iostream>
#include <string>

using namespace conduit;

namespace {

std::shared_ptr<InjaTemplateEngine> blog_templates() {
    auto engine = std::make_shared<InjaTemplateEngine>("templates", true);
    engine->add_template("layouts/app.html",
                         "<html><body>{% if existsIn(flash, \"info\") %}<p class=\"flash\">{{ flash.info.0 }}</p>{% endif %}"
                         "{{ inner_content }}</body></html>");
    engine->add_template("posts/index.html",
                         "<ul>{% for post in posts %}<li>{{ post }}</li>{% endfor %}</ul>");
    engine->add_template("posts/index.text", "{% for post in posts %}{{ post }}\n{% endfor %}");
    engine->add_template("posts/show.html", "<h1>{{ title }}</h1>");
    return engine;
}

void print(const std::string& label, const Response& response) {
    std::cout << "== " << label << "\n" << response.serialize() << "\n\n";
}

// "name=value; Path=/; ..." -> "name=value"
std::string cookie_pair(std::string_view set_cookie) {
    return std::string(set_cookie.substr(0, set_cookie.find(';')));
}

} // namespace

int main() {
    EndpointConfig config;
    config.default_layout = "layouts/app";
    config.accepted_formats = {"html", "text"};

    Endpoint endpoint(EndpointConfig::from_env(config));
    endpoint.set_templates(blog_templates());

    auto sessions = endpoint.session_store();
    auto session_options = endpoint.session_options();

    endpoint.controller("posts")
        .action("index", [](Context& ctx) -> Task<void> {
            ctx.assign("posts", {"Hello conduit", "Pipelines all the way down"});
            co_return;
        })
        .action("show", [](Context& ctx) -> Task<void> {
            render(ctx, "show.html", {{"title", std::string(ctx.param("id").value_or("missing"))}});
            co_return;
        })
        .action("create", [](Context& ctx) -> Task<void> {
            put_flash(ctx, "info", "Post created");
            ctx.flash().persist("info");
            redirect(ctx, To::internal("/posts"));
            co_return;
        })
        .plug("log_request", stages::log_request())
        .plug("accepts", stages::accepts({"html", "text"}))
        .plug("fetch_session", stages::fetch_session(sessions, session_options))
        .plug("fetch_flash", stages::fetch_flash())
        .plug_dispatch()
        .plug_auto_render(only({"index"}));

    endpoint.freeze();

    Request create(HttpMethod::POST, "/posts");
    auto created = endpoint.serve(std::move(create), "posts", "create").sync_wait();
    print("POST /posts", created);

    Request index(HttpMethod::GET, "/posts");
    if (auto set_cookie = created.header("set-cookie")) {
        index.add_header("cookie", cookie_pair(*set_cookie));
    }
    print("GET /posts", endpoint.serve(std::move(index), "posts", "index").sync_wait());

    Request show(HttpMethod::GET, "/posts/1");
    show.add_path_param("id", "1");
    print("GET /posts/1", endpoint.serve(std::move(show), "posts", "show").sync_wait());

    Request as_text(HttpMethod::GET, "/posts");
    as_text.set_query_string("_format=text");
    print("GET /posts?_format=text", endpoint.serve(std::move(as_text), "posts", "index").sync_wait());

    Request xml(HttpMethod::GET, "/posts");
    xml.add_header("accept", "application/xml");
    print("GET /posts (xml)", endpoint.serve(std::move(xml), "posts", "index").sync_wait());

    return 0;
}
