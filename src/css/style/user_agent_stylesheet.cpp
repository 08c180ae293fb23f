#include <loom/css/style/user_agent_stylesheet.h>

namespace loom::css {

std::string_view user_agent_stylesheet_source() {
    static const char kSource[] = R"CSS(
html, body, address, article, aside, blockquote, center, dd, details, dialog,
dir, div, dl, dt, fieldset, figcaption, figure, footer, form, h1, h2, h3, h4,
h5, h6, header, hgroup, hr, legend, li, main, menu, nav, ol, p, pre, section,
summary, table, tr, td, th, ul {
    display: block;
}

head, script, style, title, meta, link, base, template {
    display: none;
}

body { margin: 8px; }

p, blockquote, dl, figure, pre { margin-top: 1em; margin-bottom: 1em; }
blockquote, figure { margin-left: 40px; margin-right: 40px; }
dd { margin-left: 40px; }

ul, ol, menu, dir { margin-top: 1em; margin-bottom: 1em; padding-left: 40px; }
li ul, li ol { margin-top: 0; margin-bottom: 0; }

h1 { font-size: 2em; margin-top: 0.67em; margin-bottom: 0.67em; font-weight: bold; }
h2 { font-size: 1.5em; margin-top: 0.83em; margin-bottom: 0.83em; font-weight: bold; }
h3 { font-size: 1.17em; margin-top: 1em; margin-bottom: 1em; font-weight: bold; }
h4 { margin-top: 1.33em; margin-bottom: 1.33em; font-weight: bold; }
h5 { font-size: 0.83em; margin-top: 1.67em; margin-bottom: 1.67em; font-weight: bold; }
h6 { font-size: 0.67em; margin-top: 2.33em; margin-bottom: 2.33em; font-weight: bold; }

b, strong, th { font-weight: bold; }
i, em, cite, var, dfn, address { font-style: italic; }
pre, code, kbd, samp, tt { font-family: monospace; }
pre { white-space: pre; }
small { font-size: smaller; }
big { font-size: larger; }
center, th { text-align: center; }

hr { margin-top: 0.5em; margin-bottom: 0.5em; border: 1px solid gray; }
td, th { padding: 1px; }
a { color: blue; }
)CSS";
    return kSource;
}

const StyleSheet& user_agent_stylesheet() {
    static const StyleSheet sheet = parse_stylesheet(user_agent_stylesheet_source());
    return sheet;
}

} // namespace loom::css
