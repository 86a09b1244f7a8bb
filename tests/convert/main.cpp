#include "../../src/svgpdf/convert.hpp"
#include "../../src/svgpdf/pdf_graphics.hpp"

#include <iostream>
#include <sstream>
#include <vector>

#include <utki/debug.hpp>
#include <utki/time.hpp>

#include <papki/fs_file.hpp>

namespace{
// A4 page in points
constexpr svgpdf::real page_width = 595;
constexpr svgpdf::real page_height = 842;

class pdf_writer{
	std::vector<uint8_t> buf;
	std::vector<size_t> offsets;

	void append(const std::string& str){
		this->buf.insert(this->buf.end(), str.begin(), str.end());
	}

public:
	unsigned reserve(){
		this->offsets.push_back(0);
		return unsigned(this->offsets.size());
	}

	void add(unsigned num, const std::string& dictionary){
		this->offsets[num - 1] = this->buf.size();
		this->append(std::to_string(num) + " 0 obj\n" + dictionary + "\nendobj\n");
	}

	void add_stream(unsigned num, const std::string& dictionary_entries, utki::span<const uint8_t> data){
		this->offsets[num - 1] = this->buf.size();
		this->append(std::to_string(num) + " 0 obj\n<< " + dictionary_entries + " /Length " + std::to_string(data.size()) + " >>\nstream\n");
		this->buf.insert(this->buf.end(), data.begin(), data.end());
		this->append("\nendstream\nendobj\n");
	}

	std::vector<uint8_t> finish(unsigned root){
		std::vector<uint8_t> ret;
		std::string header = "%PDF-1.4\n";
		ret.insert(ret.end(), header.begin(), header.end());

		auto body_start = ret.size();
		ret.insert(ret.end(), this->buf.begin(), this->buf.end());

		std::stringstream ss;
		auto xref_pos = ret.size();
		ss << "xref\n0 " << (this->offsets.size() + 1) << "\n";
		ss << "0000000000 65535 f \n";
		for(auto o : this->offsets){
			auto str = std::to_string(body_start + o);
			ss << std::string(10 - str.size(), '0') << str << " 00000 n \n";
		}
		ss << "trailer\n<< /Size " << (this->offsets.size() + 1) << " /Root " << root << " 0 R >>\n";
		ss << "startxref\n" << xref_pos << "\n%%EOF\n";

		auto tail = ss.str();
		ret.insert(ret.end(), tail.begin(), tail.end());
		return ret;
	}
};
}

// NOLINTNEXTLINE(bugprone-exception-escape): fatal exceptions are not caught
int main(int argc, char **argv){
	std::string filename;
	std::string out_filename;
	switch(argc){
		case 0:
		case 1:
			std::cout << "Warning: 2 arguments expected: <in-svg-file> <out-pdf-file>" << std::endl;
			std::cout << "\t Got 0 arguments, assume <in-svg-file>=tiger.svg <out-pdf-file>=tiger.pdf" << std::endl;
			filename = "tiger.svg";
			out_filename = "tiger.pdf";
			break;
		case 2:
			std::cout << "Warning: 2 arguments expected: <in-svg-file> <out-pdf-file>" << std::endl;
			// NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
			filename = argv[1];
			{
				auto dot_index = filename.find_last_of(".", filename.size());
				if(dot_index == std::string::npos){
					dot_index = filename.size();
				}
				out_filename = filename.substr(0, dot_index) + ".pdf";
			}
			std::cout << "\t Got 1 argument, assume <in-svg-file>=" << filename << " <out-pdf-file>=" << out_filename << std::endl;
			break;
		default:
			// NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
			filename = argv[1];
			// NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
			out_filename = argv[2];
			break;
	}

	auto collabs = svgpdf::make_default_collaborators();

	auto gfx = std::dynamic_pointer_cast<svgpdf::pdf_graphics>(collabs.graphics);
	auto images = std::dynamic_pointer_cast<svgpdf::pdf_image_embedder>(collabs.images);
	utki::assert(gfx && images, SL);

	svgpdf::converter conv(svgpdf::parameters(), collabs);

	auto convert_start_ms = utki::get_ticks_ms();

	auto handle = conv.convert(filename, 0, 0, 0, 0, page_height);
	auto content = conv.render(handle);

	utki::log([&](auto&o){o << "SVG converted in " << float(utki::get_ticks_ms() - convert_start_ms) / 1000.0f << " sec." << std::endl;});

	pdf_writer w;

	auto catalog = w.reserve();
	auto pages = w.reserve();
	auto page = w.reserve();
	auto contents = w.reserve();
	auto font = w.reserve();

	std::stringstream resources;

	resources << "/Font << /F1 " << font << " 0 R >>";

	resources << " /ExtGState <<";
	for(const auto& gs : gfx->get_ext_gstates()){
		auto num = w.reserve();
		w.add(num, svgpdf::to_dictionary(gs));
		resources << " /GS" << gs.id << " " << num << " 0 R";
	}
	resources << " >>";

	resources << " /Shading <<";
	for(const auto& sh : gfx->get_shadings()){
		auto num = w.reserve();
		w.add(num, svgpdf::to_dictionary(sh));
		resources << " /Sh" << sh.id << " " << num << " 0 R";
	}
	resources << " >>";

	resources << " /XObject <<";
	for(const auto& im : images->get_images()){
		// JPEG data goes to PDF as is, other formats would need re-encoding
		if(im.mime != "image/jpeg" && im.mime != "image/jpg"){
			utki::log([&](auto&o){o << "image " << im.id << " of type " << im.mime << " is not written" << std::endl;});
			continue;
		}
		std::stringstream ss;
		ss << "/Type /XObject /Subtype /Image /Width " << im.dims.x() << " /Height " << im.dims.y()
			<< " /ColorSpace " << (im.num_channels == 1 ? "/DeviceGray" : "/DeviceRGB")
			<< " /BitsPerComponent 8 /Filter /DCTDecode";
		auto num = w.reserve();
		w.add_stream(num, ss.str(), utki::make_span(im.data));
		resources << " /Im" << im.id << " " << num << " 0 R";
	}
	resources << " >>";

	w.add(catalog, "<< /Type /Catalog /Pages " + std::to_string(pages) + " 0 R >>");
	w.add(pages, "<< /Type /Pages /Kids [" + std::to_string(page) + " 0 R] /Count 1 >>");
	w.add(
		page,
		"<< /Type /Page /Parent " + std::to_string(pages) + " 0 R /MediaBox [0 0 " + svgpdf::format_number(page_width)
			+ " " + svgpdf::format_number(page_height) + "] /Resources << " + resources.str() + " >> /Contents "
			+ std::to_string(contents) + " 0 R >>"
	);
	std::vector<uint8_t> content_bytes(content.begin(), content.end());
	w.add_stream(contents, "", utki::make_span(content_bytes));
	w.add(font, "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>");

	auto pdf = w.finish(catalog);

	papki::fs_file fi(out_filename);
	{
		papki::file::guard file_guard(fi, papki::mode::create);
		fi.write(utki::make_span(pdf));
	}

	utki::log([&](auto&o){o << "PDF written to " << out_filename << ", " << pdf.size() << " bytes" << std::endl;});

	utki::log([](auto&o){o << "[PASSED]" << std::endl;});
}
