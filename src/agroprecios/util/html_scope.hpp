#pragma once

#include <functional>
#include <list>
#include <string>

namespace agroprecios
{
	/* Counts the elements opened below the one that was current when it was created */
	class html_scope
	{
		size_t depth;

	public:
		html_scope()
		: depth(0)
		{}

		void open()
		{
			depth++;
		}

		/* True once the element the scope started in is closed */
		bool close()
		{
			if(depth == 0)
				return true;

			depth--;
			return false;
		}
	};

	/* Fires a callback when the current element closes */
	class html_watcher
	{
	public:
		typedef std::function<void()> callback_t;

	private:
		html_scope scope;
		callback_t f;

	public:
		html_watcher(callback_t f)
		: scope()
		, f(f)
		{}

		void startElement()
		{
			scope.open();
		}

		bool endElement()
		{
			if(!scope.close())
				return false;

			f();
			return true;
		}
	};

	class html_watcher_collection
	{
		std::list<html_watcher> watchers;

	public:
		void add(html_watcher::callback_t f)
		{
			watchers.emplace_back(f);
		}

		void startElement()
		{
			for(auto& w : watchers)
				w.startElement();
		}

		void endElement()
		{
			watchers.remove_if([](html_watcher& w) { return w.endElement(); });
		}
	};

	/*
	 * Collects the text below the current element and hands it over once the
	 * element closes. Text of nested elements is kept apart by a space, like
	 * "Uva<br>blanca" reading as "Uva blanca".
	 */
	class html_recorder
	{
	public:
		typedef std::function<void(std::string ch)> callback_t;

	private:
		html_scope scope;
		std::string str;
		callback_t f;

	public:
		html_recorder(callback_t f)
		: scope()
		, str()
		, f(f)
		{}

		void startElement()
		{
			str.append(" ");
			scope.open();
		}

		void characters(const std::string& ch)
		{
			str.append(ch);
		}

		bool endElement()
		{
			if(!scope.close())
			{
				str.append(" ");
				return false;
			}

			f(str);
			return true;
		}
	};
}
