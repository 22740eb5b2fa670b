#include <OrderedJson/serializer.hpp>
#include <OrderedJson/parser.hpp>
using OrderedJson::Field, OrderedJson::StructFields;
using OrderedJson::options::key, OrderedJson::options::omitempty;
#include <iostream>
#include <format>
using std::cout;
using std::endl;
using std::format;


class Account {
    std::string owner;
    long long balance = 0;
    std::string note;
public:
    Account() = default;
    Account(std::string o, long long b): owner(std::move(o)), balance(b) {}
    long long getBalance() const { return balance; }
    const std::string & getOwner() const { return owner; }

    friend struct OrderedJson::StructMeta<Account>;
};

template<> struct OrderedJson::StructMeta<Account> {
    using Fields = StructFields<
        Field<&Account::owner, "owner">,
        Field<&Account::balance, "balance", key<"amount">>,
        Field<&Account::note, "note", omitempty>
        >;
};


int main() {
    std::string out;
    if(!OrderedJson::Encode(Account("alice", 42), out)) {
        return 1;
    }
    cout << out << endl;
    /* {"owner":"alice","amount":42} */
    Account a;
    if(!OrderedJson::Decode(a, R"({"OWNER":"bob","amount":7,"unknown":true})")) {
        return 1;
    }
    cout << format("owner: {}, balance: {}", a.getOwner(), a.getBalance()) << endl;
    /* owner: bob, balance: 7 */
}
